#include "state_loader.h"
#include "errors.h"

#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static bool parse_line(std::string& line, mpz_class& out) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) return false;
    return out.set_str(line, 10) == 0;
}

unsigned StateLoader::next_file_index(const ResultStore::FileMap& files, std::size_t capacity) {
    for (auto it = files.rbegin(); it != files.rend(); ++it) {
        const std::size_t lines = ResultStore::count_lines(it->second);
        if (lines == 0) continue;
        return lines < capacity ? it->first : it->first + 1;
    }
    return 1;
}

std::optional<mpz_class> StateLoader::read_last_prime(unsigned index, const fs::path& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;

    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty() && line != "\r") last = line;
    }
    if (last.empty()) return std::nullopt;

    mpz_class v;
    if (!parse_line(last, v)) {
        throw StorageCorruptionError("last line of " + path.string() + " is not a decimal integer", index, path);
    }
    return v;
}

std::vector<mpz_class> StateLoader::read_file(unsigned index, const fs::path& path, const mpz_class* prev) const {
    std::vector<mpz_class> primes;
    std::ifstream in(path);
    if (!in) {
        throw StorageIoError("cannot open result file " + path.string(), index, path);
    }

    const std::size_t capacity = store_.layout().capacity;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        mpz_class v;
        if (!parse_line(line, v) || v < 2) {
            std::ostringstream os;
            os << "line " << lineno << " of result file '" << index << "' (" << path.string()
               << ") is not a prime candidate";
            throw StorageCorruptionError(os.str(), index, path);
        }
        if (primes.size() == capacity) {
            std::ostringstream os;
            os << "The result file with index '" << index << "' (" << path.string()
               << ") contains more primes than the allowed " << capacity << ".";
            throw StorageCorruptionError(os.str(), index, path);
        }
        const mpz_class* before = primes.empty() ? prev : &primes.back();
        if (before && v <= *before) {
            std::ostringstream os;
            os << "result file '" << index << "' (" << path.string() << ") breaks ascending order at line "
               << lineno << ": " << v << " after " << *before;
            throw StorageCorruptionError(os.str(), index, path);
        }
        primes.push_back(std::move(v));
    }
    return primes;
}

void StateLoader::handle_memory_overflow(GenerationState& st, const mpz_class& streamed_next,
                                         const ResultStore::FileMap& files) const {
    st.memory_limit_reached = true;

    // the candidate that was next when the files were written follows the last prime on disk
    std::optional<mpz_class> last_prime;
    unsigned last_index = 0;
    fs::path last_path;
    for (auto it = files.rbegin(); it != files.rend() && !last_prime; ++it) {
        last_prime = read_last_prime(it->first, it->second);
        last_index = it->first;
        last_path = it->second;
    }

    mpz_class next = last_prime ? mpz_class(*last_prime + 1) : mpz_class(0);
    if (next < streamed_next) {
        throw StorageCorruptionError(
            "Calculation indicates corrupted result files. Make sure all result files exist and that the "
            "prime numbers within are sorted ascending.",
            last_index, last_path);
    }
    st.next_candidate = next;
}

LoadResult StateLoader::load() {
    if (listener_) listener_->on_load_started();

    LoadResult r{PrimeCache(budget_), GenerationState{}};
    GenerationState& st = r.state;

    const ResultStore::FileMap& files = store_.files();
    const std::size_t capacity = store_.layout().capacity;
    const std::size_t total = files.size();
    std::size_t ordinal = 0;
    unsigned partial_index = 0;
    unsigned empty_index = 0;

    for (const auto& [index, path] : files) {
        if (listener_) listener_->on_load_progress(++ordinal, total);

        std::vector<mpz_class> batch = read_file(index, path, r.cache.empty() ? nullptr : &r.cache.back());

        // an empty file in the middle of the sequence is abnormal; keep what we have
        if (batch.empty()) {
            empty_index = index;
            break;
        }

        if (partial_index) {
            std::ostringstream os;
            os << "result file '" << partial_index << "' holds fewer than " << capacity
               << " primes but is followed by result file '" << index << "'";
            throw StorageCorruptionError(os.str(), partial_index, files.at(partial_index));
        }
        if (batch.size() < capacity) partial_index = index;

        const mpz_class streamed_next = batch.back() + 1;
        const std::size_t n = batch.size();
        try {
            r.cache.append(std::move(batch));
        } catch (const CacheExhaustedError&) {
            handle_memory_overflow(st, streamed_next, files);
            break;
        }

        st.next_candidate = streamed_next;
        st.primes_loaded += n;
        ++st.files_loaded;

        if (cancel_ && cancel_()) {
            st.aborted = true;
            break;
        }
    }

    if (empty_index) {
        // files past an empty one are not part of the sequence
        ResultStore::FileMap read(files.begin(), files.lower_bound(empty_index));
        st.next_file_index = next_file_index(read, capacity);
    } else {
        st.next_file_index = next_file_index(files, capacity);
    }

    if (listener_) listener_->on_load_finished(st.primes_loaded, st.files_loaded);
    return r;
}
