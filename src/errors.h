#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

// Root of every error the generator raises on purpose.
// candidate() is filled in by GenerationEngine when the error escapes a run.
class PrimeGenError : public std::runtime_error {
public:
    explicit PrimeGenError(const std::string& what) : std::runtime_error(what) {}

    virtual const char* kind() const noexcept { return "PrimeGenError"; }

    void set_candidate(const std::string& c) { candidate_ = c; }
    const std::string& candidate() const { return candidate_; }
    bool has_candidate() const { return !candidate_.empty(); }

private:
    std::string candidate_;
};

// Caller broke a local contract (e.g. empty basis for an odd candidate).
class InvalidInputError : public PrimeGenError {
public:
    using PrimeGenError::PrimeGenError;
    const char* kind() const noexcept override { return "InvalidInput"; }
};

// Anything wrong with a checkpoint file. index 0 = no specific file.
class StorageError : public PrimeGenError {
public:
    StorageError(const std::string& what, unsigned index, std::filesystem::path path)
        : PrimeGenError(what), index_(index), path_(std::move(path)) {}

    const char* kind() const noexcept override { return "StorageError"; }

    unsigned file_index() const { return index_; }
    const std::filesystem::path& file_path() const { return path_; }

private:
    unsigned index_;
    std::filesystem::path path_;
};

// On-disk content contradicts the checkpoint invariants.
class StorageCorruptionError : public StorageError {
public:
    using StorageError::StorageError;
    const char* kind() const noexcept override { return "StorageCorruption"; }
};

// The file system refused a read, create or write.
class StorageIoError : public StorageError {
public:
    using StorageError::StorageError;
    const char* kind() const noexcept override { return "StorageIo"; }
};

// Refused to write: file expected empty has data, or file already full.
class StorageConflictError : public StorageError {
public:
    using StorageError::StorageError;
    const char* kind() const noexcept override { return "StorageConflict"; }
};

// PrimeCache budget exhausted. The only error handled inside the engine.
class CacheExhaustedError : public PrimeGenError {
public:
    using PrimeGenError::PrimeGenError;
    const char* kind() const noexcept override { return "ResourceExhaustion"; }
};

class UnsupportedOperationError : public PrimeGenError {
public:
    using PrimeGenError::PrimeGenError;
    const char* kind() const noexcept override { return "UnsupportedOperation"; }
};
