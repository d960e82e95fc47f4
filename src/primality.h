#pragma once
#include <gmpxx.h>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

// Result of the square-root boundary search over an ascending prime list.
struct FactorBound {
    std::size_t count = 0;		// leading primes with p*p < n
    bool exact_square = false;	// primes[count]^2 == n
};

FactorBound factor_bound(const std::vector<mpz_class>& primes_asc, const mpz_class& n);

// Trial division against a gapless ascending prime list.
// Large factor sets are fanned out over a fixed pool of threads; the calling
// thread takes slice 0, so T threads in total touch the list.
class PrimalityTester {
public:
    // threads == 0 -> hardware concurrency.
    explicit PrimalityTester(unsigned threads = 0, std::size_t parallel_threshold = 4096);
    ~PrimalityTester();

    PrimalityTester(const PrimalityTester&) = delete;
    PrimalityTester& operator=(const PrimalityTester&) = delete;

    // Throws InvalidInputError when primes_asc is empty but a factor could exist,
    // UnsupportedOperationError when the list is too short to cover sqrt(n).
    bool is_prime(const std::vector<mpz_class>& primes_asc, const mpz_class& n);

    unsigned threads() const { return T_; }
    std::size_t parallel_threshold() const { return threshold_; }

private:
    bool has_factor(const std::vector<mpz_class>& primes, std::size_t count, const mpz_class& n);
    void scan_slice(unsigned i);
    void worker_loop(unsigned i);

    unsigned T_;
    std::size_t threshold_;
    std::vector<std::thread> workers_;

    std::mutex mx_;
    std::condition_variable job_cv_;
    std::condition_variable done_cv_;
    std::uint64_t job_seq_ = 0;
    unsigned busy_ = 0;
    bool shutdown_ = false;

    // current job, stable while busy_ > 0
    const mpz_class* job_primes_ = nullptr;
    std::size_t job_count_ = 0;
    const mpz_class* job_n_ = nullptr;

    std::atomic<bool> stop_all_{false};
    std::atomic<bool> found_{false};
};
