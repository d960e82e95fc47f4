#pragma once
#include <gmpxx.h>
#include <cstddef>
#include <vector>

// Limits for the in-memory prime list. 0 = unlimited.
struct CacheBudget {
    std::size_t max_primes = 0;
    std::size_t max_bytes = 0;
};

// Ascending list of every prime found so far, bounded by a CacheBudget.
// Growth past the budget throws CacheExhaustedError and leaves the cache unchanged.
class PrimeCache {
public:
    explicit PrimeCache(CacheBudget budget = {}) : budget_(budget) {}

    void push_back(const mpz_class& p);

    // All or nothing: either every prime of the batch is added or none is.
    void append(std::vector<mpz_class>&& batch);

    const std::vector<mpz_class>& primes() const { return primes_; }
    std::size_t size() const { return primes_.size(); }
    bool empty() const { return primes_.empty(); }
    const mpz_class& back() const { return primes_.back(); }
    const mpz_class& operator[](std::size_t i) const { return primes_[i]; }

    std::size_t bytes_used() const { return bytes_; }
    const CacheBudget& budget() const { return budget_; }

    // Storage charged against max_bytes for one value.
    static std::size_t footprint(const mpz_class& p);

private:
    void check_budget(std::size_t add_count, std::size_t add_bytes) const;

    CacheBudget budget_;
    std::vector<mpz_class> primes_;
    std::size_t bytes_ = 0;
};
