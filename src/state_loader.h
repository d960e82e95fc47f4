#pragma once
#include <gmpxx.h>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

#include "events.h"
#include "prime_cache.h"
#include "result_store.h"

// Where a run resumes. Rebuilt from the checkpoint files on every start.
struct GenerationState {
    mpz_class next_candidate{2};
    bool memory_limit_reached = false;
    unsigned next_file_index = 1;		// file with room for the next prime
    bool aborted = false;				// cancelled while loading; do not generate
    std::size_t primes_loaded = 0;
    std::size_t files_loaded = 0;
};

struct LoadResult {
    PrimeCache cache;
    GenerationState state;
};

// Replays checkpoint files into a fresh PrimeCache. Files are checked for
// structure (numbers, order, sizes) but primality is not re-verified.
class StateLoader {
public:
    using CancelPoll = std::function<bool()>;

    StateLoader(const ResultStore& store, CacheBudget budget) : store_(store), budget_(budget) {}

    void set_listener(GenerationListener* l) { listener_ = l; }
    void set_cancel_poll(CancelPoll p) { cancel_ = std::move(p); }

    LoadResult load();

    static unsigned next_file_index(const ResultStore::FileMap& files, std::size_t capacity);

    // Last prime of a checkpoint file, nullopt when the file holds none.
    static std::optional<mpz_class> read_last_prime(unsigned index, const std::filesystem::path& path);

private:
    std::vector<mpz_class> read_file(unsigned index, const std::filesystem::path& path,
                                     const mpz_class* prev) const;
    void handle_memory_overflow(GenerationState& st, const mpz_class& streamed_next,
                                const ResultStore::FileMap& files) const;

    const ResultStore& store_;
    CacheBudget budget_;
    GenerationListener* listener_ = nullptr;
    CancelPoll cancel_;
};
