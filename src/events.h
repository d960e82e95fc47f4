#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>

// One contiguous run of primes written to a checkpoint file.
struct CheckpointWritten {
    unsigned file_index = 0;
    std::uint64_t first_prime = 0;		// 0-based ordinal in the whole prime sequence
    std::uint64_t last_prime = 0;		// inclusive
    std::chrono::system_clock::time_point written_at;
    std::chrono::steady_clock::duration since_last_write{};
    std::filesystem::path path;
};

// Observer of a generation run. All callbacks arrive synchronously on the
// control thread, after the step that produced them has completed.
class GenerationListener {
public:
    virtual ~GenerationListener() = default;

    virtual void on_load_started() {}
    // ordinal is 1-based
    virtual void on_load_progress(std::size_t /*ordinal*/, std::size_t /*total*/) {}
    virtual void on_load_finished(std::size_t /*primes_loaded*/, std::size_t /*files_loaded*/) {}
    virtual void on_generation_started() {}
    virtual void on_checkpoint_written(const CheckpointWritten& /*ev*/) {}
};
