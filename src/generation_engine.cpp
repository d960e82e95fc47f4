#include "generation_engine.h"
#include "errors.h"

#include <sstream>

const char* phase_name(GenerationPhase p) {
    switch (p) {
        case GenerationPhase::loading: return "loading";
        case GenerationPhase::memory_generation: return "memory-generation";
        case GenerationPhase::overflowing: return "overflowing";
        case GenerationPhase::disk_generation: return "disk-generation";
        case GenerationPhase::stopped: return "stopped";
    }
    return "unknown";
}

void GenerationEngine::Broadcast::on_load_started() {
    for (auto* l : listeners) l->on_load_started();
}

void GenerationEngine::Broadcast::on_load_progress(std::size_t ordinal, std::size_t total) {
    for (auto* l : listeners) l->on_load_progress(ordinal, total);
}

void GenerationEngine::Broadcast::on_load_finished(std::size_t primes_loaded, std::size_t files_loaded) {
    for (auto* l : listeners) l->on_load_finished(primes_loaded, files_loaded);
}

void GenerationEngine::Broadcast::on_generation_started() {
    for (auto* l : listeners) l->on_generation_started();
}

void GenerationEngine::Broadcast::on_checkpoint_written(const CheckpointWritten& ev) {
    for (auto* l : listeners) l->on_checkpoint_written(ev);
}

GenerationEngine::GenerationEngine(ResultStore& store, PrimalityTester& tester, CacheBudget budget)
    : store_(store), tester_(tester), budget_(budget), cache_(budget) {
    store_.set_write_handler([this](const CheckpointWritten& ev) { broadcast_.on_checkpoint_written(ev); });
}

GenerationEngine::~GenerationEngine() {
    store_.set_write_handler(nullptr);
}

void GenerationEngine::run() {
    try {
        load();
        if (loaded_.aborted) {
            phase_ = GenerationPhase::stopped;
            return;
        }

        broadcast_.on_generation_started();
        store_.mark_generation_started();

        // everything loaded came from disk; nothing to flush when the limit was hit while loading
        if (!loaded_.memory_limit_reached) {
            generate_in_memory();
            if (phase_ == GenerationPhase::stopped) return;
            store_overflow();
        }

        generate_on_disk();
    } catch (PrimeGenError& e) {
        phase_ = GenerationPhase::stopped;
        e.set_candidate(candidate_.get_str());
        throw;
    } catch (...) {
        phase_ = GenerationPhase::stopped;
        throw;
    }
}

void GenerationEngine::load() {
    phase_ = GenerationPhase::loading;
    store_.refresh();

    StateLoader loader(store_, budget_);
    loader.set_listener(&broadcast_);
    loader.set_cancel_poll(cancel_);

    LoadResult r = loader.load();
    loaded_ = r.state;
    cache_ = std::move(r.cache);
    candidate_ = loaded_.next_candidate;
    stored_ = cache_.size();
    store_.resume_at(loaded_.next_file_index);
}

void GenerationEngine::generate_in_memory() {
    phase_ = GenerationPhase::memory_generation;
    const std::size_t capacity = store_.layout().capacity;

    // cancellation is honoured between candidates, never during a test
    while (!cancel_requested()) {
        const bool prime = tester_.is_prime(cache_.primes(), candidate_);
        if (counters_) counters_->candidates_tested.fetch_add(1, std::memory_order_relaxed);

        if (prime) {
            try {
                cache_.push_back(candidate_);
            } catch (const CacheExhaustedError&) {
                phase_ = GenerationPhase::overflowing;
                return;
            }
            if (counters_) counters_->primes_found.fetch_add(1, std::memory_order_relaxed);

            if (cache_.size() % capacity == 0) flush_unstored();
        }

        ++candidate_;
    }

    phase_ = GenerationPhase::stopped;
}

// candidate_ passed is_prime() and only failed to enter the cache
void GenerationEngine::store_overflow() {
    phase_ = GenerationPhase::overflowing;
    flush_unstored();

    std::vector<mpz_class> overflowed{candidate_};
    store_.append(overflowed);
    if (counters_) counters_->primes_found.fetch_add(1, std::memory_order_relaxed);
    ++candidate_;
}

void GenerationEngine::generate_on_disk() {
    phase_ = GenerationPhase::disk_generation;
    if (cancel_requested()) {
        phase_ = GenerationPhase::stopped;
        return;
    }

    std::ostringstream os;
    os << "disk-backed prime generation is not supported (" << cache_.size()
       << " primes held in memory, cache budget exhausted)";
    throw UnsupportedOperationError(os.str());
}

void GenerationEngine::flush_unstored() {
    if (stored_ >= cache_.size()) return;
    const auto& primes = cache_.primes();
    store_.append(primes.begin() + static_cast<std::ptrdiff_t>(stored_), primes.end());
    stored_ = cache_.size();
}
