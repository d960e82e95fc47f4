#pragma once
#include <gmpxx.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "events.h"

// Naming and sizing of checkpoint files: <prefix><index><extension>.
struct StoreLayout {
    std::size_t capacity = 10000;			// primes per file
    std::string prefix = "PrimeNumbers";
    std::string extension = ".txt";
};

// Chunked, append-only persistence of the prime sequence.
// Only the highest-indexed file may be partial; indices are contiguous from 1.
class ResultStore {
public:
    using WriteHandler = std::function<void(const CheckpointWritten&)>;
    using FileMap = std::map<unsigned, std::filesystem::path>;

    ResultStore(std::filesystem::path dir, StoreLayout layout);

    // Maximal run of files with indices 1, 2, 3, ... found in dir.
    static FileMap list_checkpoint_files(const std::filesystem::path& dir, const StoreLayout& layout);

    // Index encoded in a file name, if it follows the layout.
    static std::optional<unsigned> parse_index(const std::string& filename, const StoreLayout& layout);

    static std::size_t count_lines(const std::filesystem::path& p);

    void refresh();
    const FileMap& files() const { return files_; }
    std::filesystem::path path_for(unsigned index) const;

    const StoreLayout& layout() const { return layout_; }
    const std::filesystem::path& directory() const { return dir_; }

    // Forget listed files past 'index', the file the next prime belongs in.
    void resume_at(unsigned index);

    void set_write_handler(WriteHandler h) { on_write_ = std::move(h); }

    // Start of the interval reported with the first write.
    void mark_generation_started();

    // Writes the primes after the current end of the sequence on disk,
    // rolling over to new files whenever one reaches capacity.
    void append(std::vector<mpz_class>::const_iterator first, std::vector<mpz_class>::const_iterator last);
    void append(const std::vector<mpz_class>& primes) { append(primes.begin(), primes.end()); }

private:
    void prepare_for_writing();
    void allocate_file(unsigned index);
    void check_no_data_after(unsigned index) const;
    void emit(unsigned index, std::uint64_t first, std::uint64_t last, const std::filesystem::path& path);

    std::filesystem::path dir_;
    StoreLayout layout_;
    FileMap files_;
    WriteHandler on_write_;
    std::chrono::steady_clock::time_point last_write_;
};
