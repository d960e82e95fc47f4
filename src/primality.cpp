#include "primality.h"
#include "errors.h"

#include <algorithm>
#include <sstream>

FactorBound factor_bound(const std::vector<mpz_class>& primes_asc, const mpz_class& n) {
    FactorBound fb;
    // p*p is monotonic in p, so the list is partitioned on p*p < n
    auto it = std::partition_point(primes_asc.begin(), primes_asc.end(),
                                   [&n](const mpz_class& p) { return p * p < n; });
    fb.count = static_cast<std::size_t>(it - primes_asc.begin());
    if (it != primes_asc.end()) {
        mpz_class sq = (*it) * (*it);
        fb.exact_square = (sq == n);
    }
    return fb;
}

PrimalityTester::PrimalityTester(unsigned threads, std::size_t parallel_threshold)
    : T_(threads ? threads : std::thread::hardware_concurrency()),
      threshold_(parallel_threshold) {
    if (T_ == 0) T_ = 1;
    workers_.reserve(T_ - 1);
    for (unsigned i = 1; i < T_; i++) {
        workers_.emplace_back([this, i]() { worker_loop(i); });
    }
}

PrimalityTester::~PrimalityTester() {
    {
        std::scoped_lock lk(mx_);
        shutdown_ = true;
    }
    job_cv_.notify_all();
    for (auto& th : workers_) th.join();
}

bool PrimalityTester::is_prime(const std::vector<mpz_class>& primes_asc, const mpz_class& n) {
    if (n < 2) return false;
    if (n == 2) return true;
    if (mpz_even_p(n.get_mpz_t())) return false;

    FactorBound fb = factor_bound(primes_asc, n);
    if (fb.exact_square) return false;

    if (fb.count == primes_asc.size()) {
        // every known prime squared is below n: factors may exist beyond the list
        std::ostringstream os;
        if (primes_asc.empty()) {
            os << "cannot test " << n << ": no known primes to divide by";
            throw InvalidInputError(os.str());
        }
        os << "cannot test " << n << ": largest known prime " << primes_asc.back()
           << " is below its square root and disk-backed factors are not supported";
        throw UnsupportedOperationError(os.str());
    }

    return !has_factor(primes_asc, fb.count, n);
}

bool PrimalityTester::has_factor(const std::vector<mpz_class>& primes, std::size_t count, const mpz_class& n) {
    if (T_ == 1 || count < threshold_) {
        for (std::size_t k = 0; k < count; ++k) {
            if (mpz_divisible_p(n.get_mpz_t(), primes[k].get_mpz_t())) return true;
        }
        return false;
    }

    {
        std::scoped_lock lk(mx_);
        job_primes_ = primes.data();
        job_count_ = count;
        job_n_ = &n;
        stop_all_.store(false, std::memory_order_relaxed);
        found_.store(false, std::memory_order_relaxed);
        busy_ = static_cast<unsigned>(workers_.size());
        ++job_seq_;
    }
    job_cv_.notify_all();

    scan_slice(0);

    std::unique_lock lk(mx_);
    done_cv_.wait(lk, [this]() { return busy_ == 0; });
    return found_.load(std::memory_order_relaxed);
}

// worker i checks primes i, i+T, i+2T, ... so every slice starts on the small ones
void PrimalityTester::scan_slice(unsigned i) {
    mpz_srcptr n = job_n_->get_mpz_t();
    for (std::size_t k = i; k < job_count_; k += T_) {
        if (stop_all_.load(std::memory_order_relaxed)) return;
        if (mpz_divisible_p(n, job_primes_[k].get_mpz_t())) {
            found_.store(true, std::memory_order_relaxed);
            stop_all_.store(true, std::memory_order_relaxed);
            return;
        }
    }
}

void PrimalityTester::worker_loop(unsigned i) {
    std::uint64_t seen = 0;
    for (;;) {
        {
            std::unique_lock lk(mx_);
            job_cv_.wait(lk, [&]() { return shutdown_ || job_seq_ != seen; });
            if (shutdown_) return;
            seen = job_seq_;
        }

        scan_slice(i);

        {
            std::scoped_lock lk(mx_);
            if (--busy_ == 0) done_cv_.notify_one();
        }
    }
}
