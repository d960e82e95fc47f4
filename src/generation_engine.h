#pragma once
#include <gmpxx.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "events.h"
#include "prime_cache.h"
#include "primality.h"
#include "result_store.h"
#include "state_loader.h"

enum class GenerationPhase {
    loading,
    memory_generation,
    overflowing,
    disk_generation,
    stopped,
};

const char* phase_name(GenerationPhase p);

// Read by the progress reporter while the control thread runs.
struct GenerationCounters {
    std::atomic<std::uint64_t> candidates_tested{0};
    std::atomic<std::uint64_t> primes_found{0};
};

// Drives Loading -> MemoryGeneration -> Overflowing -> DiskGeneration -> Stopped.
//
// run() returns normally only when cancelled. Every other end of a run is an
// exception; PrimeGenError instances get the in-flight candidate attached.
// The engine never logs; it reports through GenerationListener.
class GenerationEngine {
public:
    using CancelPoll = std::function<bool()>;

    GenerationEngine(ResultStore& store, PrimalityTester& tester, CacheBudget budget = {});
    ~GenerationEngine();

    GenerationEngine(const GenerationEngine&) = delete;
    GenerationEngine& operator=(const GenerationEngine&) = delete;

    void add_listener(GenerationListener* l) { broadcast_.listeners.push_back(l); }
    void set_cancel_poll(CancelPoll p) { cancel_ = std::move(p); }
    void set_counters(GenerationCounters* c) { counters_ = c; }

    void run();

    GenerationPhase phase() const { return phase_; }
    const PrimeCache& cache() const { return cache_; }
    const mpz_class& current_candidate() const { return candidate_; }
    const GenerationState& loaded_state() const { return loaded_; }

private:
    struct Broadcast : GenerationListener {
        std::vector<GenerationListener*> listeners;

        void on_load_started() override;
        void on_load_progress(std::size_t ordinal, std::size_t total) override;
        void on_load_finished(std::size_t primes_loaded, std::size_t files_loaded) override;
        void on_generation_started() override;
        void on_checkpoint_written(const CheckpointWritten& ev) override;
    };

    bool cancel_requested() const { return cancel_ && cancel_(); }

    void load();
    void generate_in_memory();
    void store_overflow();
    void generate_on_disk();
    void flush_unstored();

    ResultStore& store_;
    PrimalityTester& tester_;
    CacheBudget budget_;
    CancelPoll cancel_;
    GenerationCounters* counters_ = nullptr;
    Broadcast broadcast_;

    GenerationPhase phase_ = GenerationPhase::stopped;
    GenerationState loaded_;
    PrimeCache cache_;
    mpz_class candidate_{0};
    std::size_t stored_ = 0;		// cache entries already on disk
};
