#include "prime_cache.h"
#include "errors.h"

#include <sstream>

std::size_t PrimeCache::footprint(const mpz_class& p) {
    return sizeof(mpz_class) + mpz_size(p.get_mpz_t()) * sizeof(mp_limb_t);
}

void PrimeCache::check_budget(std::size_t add_count, std::size_t add_bytes) const {
    if (budget_.max_primes && primes_.size() + add_count > budget_.max_primes) {
        std::ostringstream os;
        os << "prime cache is full: " << primes_.size() << " + " << add_count
           << " primes exceeds the limit of " << budget_.max_primes;
        throw CacheExhaustedError(os.str());
    }
    if (budget_.max_bytes && bytes_ + add_bytes > budget_.max_bytes) {
        std::ostringstream os;
        os << "prime cache is full: " << bytes_ << " + " << add_bytes
           << " bytes exceeds the limit of " << budget_.max_bytes;
        throw CacheExhaustedError(os.str());
    }
}

void PrimeCache::push_back(const mpz_class& p) {
    const std::size_t b = footprint(p);
    check_budget(1, b);
    primes_.push_back(p);
    bytes_ += b;
}

void PrimeCache::append(std::vector<mpz_class>&& batch) {
    std::size_t b = 0;
    for (const auto& p : batch) b += footprint(p);
    check_budget(batch.size(), b);

    primes_.reserve(primes_.size() + batch.size());
    for (auto& p : batch) primes_.push_back(std::move(p));
    bytes_ += b;
    batch.clear();
}
