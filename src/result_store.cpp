#include "result_store.h"
#include "errors.h"

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

static StorageCorruptionError overfilled_error(unsigned index, const fs::path& path, std::size_t lines,
                                               std::size_t capacity) {
    std::ostringstream os;
    os << "The result file with index '" << index << "' (" << path.string() << ") contains " << lines
       << " primes, more than the allowed " << capacity << ".";
    return StorageCorruptionError(os.str(), index, path);
}

ResultStore::ResultStore(fs::path dir, StoreLayout layout)
    : dir_(std::move(dir)), layout_(std::move(layout)), last_write_(std::chrono::steady_clock::now()) {
    refresh();
}

std::optional<unsigned> ResultStore::parse_index(const std::string& filename, const StoreLayout& layout) {
    const std::size_t pl = layout.prefix.size();
    const std::size_t el = layout.extension.size();
    if (filename.size() <= pl + el) return std::nullopt;
    if (filename.compare(0, pl, layout.prefix) != 0) return std::nullopt;
    if (filename.compare(filename.size() - el, el, layout.extension) != 0) return std::nullopt;

    const std::string id = filename.substr(pl, filename.size() - pl - el);
    // "07" would alias "7"
    if (id[0] == '0') return std::nullopt;

    unsigned long long v = 0;
    for (char c : id) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned>::max()) return std::nullopt;
    }
    return static_cast<unsigned>(v);
}

ResultStore::FileMap ResultStore::list_checkpoint_files(const fs::path& dir, const StoreLayout& layout) {
    FileMap found;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return found;

    for (const auto& entry : it) {
        std::error_code e2;
        if (!entry.is_regular_file(e2)) continue;
        auto idx = parse_index(entry.path().filename().string(), layout);
        if (idx) found.emplace(*idx, entry.path());
    }

    // keep 1..k only; anything after a gap cannot be verified
    FileMap consecutive;
    unsigned expect = 1;
    for (const auto& [idx, path] : found) {
        if (idx != expect) break;
        consecutive.emplace(idx, path);
        ++expect;
    }
    return consecutive;
}

std::size_t ResultStore::count_lines(const fs::path& p) {
    std::ifstream in(p);
    if (!in) return 0;
    std::size_t n = 0;
    std::string line;
    while (std::getline(in, line)) ++n;
    return n;
}

void ResultStore::refresh() {
    files_ = list_checkpoint_files(dir_, layout_);
}

fs::path ResultStore::path_for(unsigned index) const {
    return dir_ / (layout_.prefix + std::to_string(index) + layout_.extension);
}

void ResultStore::mark_generation_started() {
    last_write_ = std::chrono::steady_clock::now();
}

void ResultStore::allocate_file(unsigned index) {
    const fs::path path = path_for(index);

    std::error_code ec;
    if (fs::exists(path, ec)) {
        auto size = fs::file_size(path, ec);
        if (ec || size > 0) {
            std::ostringstream os;
            os << "The result file with index '" << index << "' (" << path.string()
               << ") was expected to be empty but already contains data.";
            throw StorageConflictError(os.str(), index, path);
        }
        if (!fs::remove(path, ec) || ec) {
            throw StorageIoError("cannot recreate empty result file " + path.string(), index, path);
        }
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw StorageIoError("cannot create result file " + path.string(), index, path);
    }
    files_.emplace(index, path);
}

void ResultStore::resume_at(unsigned index) {
    files_.erase(files_.upper_bound(index), files_.end());
}

// writing into 'index' while a later file holds primes would break the ordering
void ResultStore::check_no_data_after(unsigned index) const {
    const fs::path next = path_for(index + 1);
    std::error_code ec;
    if (!fs::exists(next, ec)) return;
    auto size = fs::file_size(next, ec);
    if (ec || size > 0) {
        std::ostringstream os;
        os << "Refusing to append to the result file with index '" << index << "' because the result file with index '"
           << (index + 1) << "' (" << next.string() << ") already contains data.";
        throw StorageConflictError(os.str(), index + 1, next);
    }
}

void ResultStore::prepare_for_writing() {
    if (files_.empty()) {
        allocate_file(1);
        return;
    }

    const auto& [index, path] = *files_.rbegin();
    const std::size_t lines = count_lines(path);
    if (lines == layout_.capacity) {
        allocate_file(index + 1);
    } else if (lines > layout_.capacity) {
        throw overfilled_error(index, path, lines, layout_.capacity);
    }
}

void ResultStore::append(std::vector<mpz_class>::const_iterator first,
                         std::vector<mpz_class>::const_iterator last) {
    if (first == last) return;

    prepare_for_writing();

    auto it = first;
    while (it != last) {
        const unsigned index = files_.rbegin()->first;
        const fs::path path = files_.rbegin()->second;

        std::size_t lines = count_lines(path);
        if (lines > layout_.capacity) {
            throw overfilled_error(index, path, lines, layout_.capacity);
        }
        if (lines == layout_.capacity) {
            std::ostringstream os;
            os << "Refusing to append to the full result file with index '" << index << "' ("
               << path.string() << ").";
            throw StorageConflictError(os.str(), index, path);
        }
        check_no_data_after(index);

        std::ofstream out(path, std::ios::out | std::ios::app);
        if (!out) {
            throw StorageIoError("cannot open result file " + path.string(), index, path);
        }

        const std::uint64_t start = static_cast<std::uint64_t>(index - 1) * layout_.capacity + lines;
        std::uint64_t written = 0;
        while (it != last && lines < layout_.capacity) {
            out << *it << '\n';
            ++it;
            ++lines;
            ++written;
        }
        out.flush();
        out.close();
        if (out.fail()) {
            throw StorageIoError("write to result file " + path.string() + " failed", index, path);
        }

        emit(index, start, start + written - 1, path);

        if (it != last) allocate_file(index + 1);
    }
}

void ResultStore::emit(unsigned index, std::uint64_t first, std::uint64_t last, const fs::path& path) {
    const auto now = std::chrono::steady_clock::now();

    CheckpointWritten ev;
    ev.file_index = index;
    ev.first_prime = first;
    ev.last_prime = last;
    ev.written_at = std::chrono::system_clock::now();
    ev.since_last_write = now - last_write_;
    ev.path = path;
    last_write_ = now;

    if (on_write_) on_write_(ev);
}
