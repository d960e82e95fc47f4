#include <iostream>
#include <assert.h>
#include <sstream>
#include <string>
#include <vector>
#include <gmpxx.h>
#include "../errors.h"
#include "../result_store.h"
#include "../state_loader.h"
#include "TestUtil.hpp"

static StoreLayout layout_with(std::size_t capacity)
{
    StoreLayout l;
    l.capacity = capacity;
    return l;
}

// Records load notifications as a compact string.
class RecordingListener : public GenerationListener {
public:
    std::stringstream log;

    void on_load_started() override { log << "started "; }
    void on_load_progress(std::size_t ordinal, std::size_t total) override { log << ordinal << "/" << total << " "; }
    void on_load_finished(std::size_t primes, std::size_t files) override { log << "finished(" << primes << "," << files << ")"; }
};

static LoadResult load_dir(const TempDir& dir, std::size_t capacity, CacheBudget budget = {},
                           RecordingListener* listener = nullptr)
{
    ResultStore store(dir.path, layout_with(capacity));
    StateLoader loader(store, budget);
    loader.set_listener(listener);
    return loader.load();
}

void testEmptyDirectory()
{
    std::cout << "----- testEmptyDirectory() ----------------\n";

    TempDir dir("load-empty");
    RecordingListener rec;
    LoadResult r = load_dir(dir, 5, {}, &rec);

    std::cout << "ACTUAL: " << rec.log.str() << "\n";
    std::cout << "EXPECT: started finished(0,0)\n";
    assert(rec.log.str() == "started finished(0,0)");
    assert(r.cache.empty());
    assert(r.state.next_candidate == 2);
    assert(r.state.next_file_index == 1);
    assert(r.state.files_loaded == 0);
    assert(!r.state.memory_limit_reached);
    assert(!r.state.aborted);
}

void testCompleteFile()
{
    std::cout << "----- testCompleteFile() ------------------\n";

    TempDir dir("load-complete");
    write_lines(dir.file("PrimeNumbers1.txt"), {"2", "3", "5", "7", "11"});

    RecordingListener rec;
    LoadResult r = load_dir(dir, 5, {}, &rec);

    std::cout << "ACTUAL: " << rec.log.str() << "\n";
    assert(rec.log.str() == "started 1/1 finished(5,1)");
    assert(to_string(r.cache.primes()) == "[2, 3, 5, 7, 11]");
    assert(r.state.next_candidate == 12);
    assert(r.state.next_file_index == 2);
    assert(r.state.primes_loaded == 5);
    assert(r.state.files_loaded == 1);
}

void testIndexGapIgnored()
{
    std::cout << "----- testIndexGapIgnored() ---------------\n";

    TempDir dir("load-gap");
    write_lines(dir.file("PrimeNumbers1.txt"), {"2", "3", "5", "7", "11"});
    write_lines(dir.file("PrimeNumbers3.txt"), {"23", "29"});

    LoadResult r = load_dir(dir, 5);
    assert(to_string(r.cache.primes()) == "[2, 3, 5, 7, 11]");
    assert(r.state.next_candidate == 12);
    assert(r.state.next_file_index == 2);
    assert(r.state.files_loaded == 1);
}

void testOverfilledFile()
{
    std::cout << "----- testOverfilledFile() ----------------\n";

    TempDir dir("load-overfilled");
    write_lines(dir.file("PrimeNumbers1.txt"), {"2", "3", "5", "7", "11", "13"});

    bool thrown = false;
    try {
        load_dir(dir, 5);
    } catch (const StorageCorruptionError& e) {
        std::cout << "Caught: " << e.what() << "\n";
        assert(e.file_index() == 1);
        assert(e.file_path() == dir.file("PrimeNumbers1.txt"));
        thrown = true;
    }
    assert(thrown);
}

void testPartialLastFile()
{
    std::cout << "----- testPartialLastFile() ---------------\n";

    TempDir dir("load-partial");
    write_lines(dir.file("PrimeNumbers1.txt"), {"2", "3", "5", "7", "11"});
    write_lines(dir.file("PrimeNumbers2.txt"), {"13", "17"});

    LoadResult r = load_dir(dir, 5);
    assert(r.cache.size() == 7);
    assert(r.state.next_candidate == 18);
    assert(r.state.next_file_index == 2);
    assert(r.state.files_loaded == 2);
}

void testEmptyFileStopsLoading()
{
    std::cout << "----- testEmptyFileStopsLoading() ---------\n";

    TempDir dir("load-emptyfile");
    write_lines(dir.file("PrimeNumbers1.txt"), {"2", "3"});
    write_lines(dir.file("PrimeNumbers2.txt"), {});
    write_lines(dir.file("PrimeNumbers3.txt"), {"5", "7"});

    LoadResult r = load_dir(dir, 2);
    assert(to_string(r.cache.primes()) == "[2, 3]");
    assert(r.state.next_candidate == 4);
    assert(r.state.files_loaded == 1);
    // the empty file is where writing resumes, not after file 3
    assert(r.state.next_file_index == 2);

    TempDir partial("load-emptyfile-partial");
    write_lines(partial.file("PrimeNumbers1.txt"), {"2"});
    write_lines(partial.file("PrimeNumbers2.txt"), {});
    write_lines(partial.file("PrimeNumbers3.txt"), {"5", "7"});
    assert(load_dir(partial, 2).state.next_file_index == 1);
}

void testWindowsLineEndings()
{
    std::cout << "----- testWindowsLineEndings() ------------\n";

    TempDir dir("load-crlf");
    write_lines(dir.file("PrimeNumbers1.txt"), {"2\r", "3\r", "5\r"});

    LoadResult r = load_dir(dir, 5);
    assert(to_string(r.cache.primes()) == "[2, 3, 5]");
    assert(r.state.next_candidate == 6);
}

void testStructuralCorruption()
{
    std::cout << "----- testStructuralCorruption() ----------\n";

    struct Case { const char* name; std::vector<std::string> f1; std::vector<std::string> f2; unsigned bad; };
    std::vector<Case> cases = {
        {"descending", {"2", "5", "3"}, {}, 1},
        {"duplicate", {"2", "3", "3"}, {}, 1},
        {"garbage", {"2", "three"}, {}, 1},
        {"below-two", {"1", "2"}, {}, 1},
        {"blank-line", {"2", "", "3"}, {}, 1},
        {"order-across-files", {"2", "3", "5"}, {"5", "7"}, 2},
        {"partial-then-data", {"2", "3"}, {"5", "7", "11"}, 1},
    };

    for (const auto& c : cases) {
        TempDir dir(std::string("load-") + c.name);
        write_lines(dir.file("PrimeNumbers1.txt"), c.f1);
        if (!c.f2.empty()) write_lines(dir.file("PrimeNumbers2.txt"), c.f2);

        unsigned got = 0;
        try {
            load_dir(dir, 3);
        } catch (const StorageCorruptionError& e) {
            got = e.file_index();
            std::cout << c.name << ": " << e.what() << "\n";
        }
        assert(got == c.bad);
    }
}

void testIdempotentLoad()
{
    std::cout << "----- testIdempotentLoad() ----------------\n";

    TempDir dir("load-twice");
    std::vector<mpz_class> ps = reference_primes_below(200);	// 46 primes
    {
        ResultStore store(dir.path, layout_with(10));
        store.append(ps);
    }

    LoadResult a = load_dir(dir, 10);
    LoadResult b = load_dir(dir, 10);
    assert(a.cache.primes() == b.cache.primes());
    assert(a.cache.primes() == ps);
    assert(a.state.next_candidate == b.state.next_candidate);
    assert(a.state.next_candidate == 200);	// 199 is the last prime below 200
    assert(a.state.next_file_index == 5);
    assert(b.state.files_loaded == 5);
}

void testMemoryLimitWhileLoading()
{
    std::cout << "----- testMemoryLimitWhileLoading() -------\n";

    TempDir dir("load-memlimit");
    write_lines(dir.file("PrimeNumbers1.txt"), {"2", "3", "5"});
    write_lines(dir.file("PrimeNumbers2.txt"), {"7", "11", "13"});
    write_lines(dir.file("PrimeNumbers3.txt"), {"17", "19"});

    CacheBudget budget;
    budget.max_primes = 4;
    RecordingListener rec;
    LoadResult r = load_dir(dir, 3, budget, &rec);

    std::cout << "ACTUAL: " << rec.log.str() << "\n";
    std::cout << "EXPECT: started 1/3 2/3 finished(3,1)\n";
    assert(rec.log.str() == "started 1/3 2/3 finished(3,1)");
    assert(r.state.memory_limit_reached);
    assert(to_string(r.cache.primes()) == "[2, 3, 5]");
    // recovered from the last line of the last file, not from what fit in memory
    assert(r.state.next_candidate == 20);
    assert(r.state.next_file_index == 3);
}

void testMemoryLimitInconsistentFiles()
{
    std::cout << "----- testMemoryLimitInconsistentFiles() --\n";

    TempDir dir("load-inconsistent");
    write_lines(dir.file("PrimeNumbers1.txt"), {"2", "3", "5"});
    write_lines(dir.file("PrimeNumbers2.txt"), {"7", "11", "13"});
    write_lines(dir.file("PrimeNumbers3.txt"), {"4"});

    CacheBudget budget;
    budget.max_primes = 4;
    bool thrown = false;
    try {
        load_dir(dir, 3, budget);
    } catch (const StorageCorruptionError& e) {
        std::cout << "Caught: " << e.what() << "\n";
        assert(std::string(e.what()).find("ascending") != std::string::npos);
        assert(e.file_index() == 3);
        thrown = true;
    }
    assert(thrown);
}

void testCancellation()
{
    std::cout << "----- testCancellation() ------------------\n";

    TempDir dir("load-cancel");
    write_lines(dir.file("PrimeNumbers1.txt"), {"2", "3"});
    write_lines(dir.file("PrimeNumbers2.txt"), {"5", "7"});

    ResultStore store(dir.path, layout_with(2));
    StateLoader loader(store, {});
    int polls = 0;
    loader.set_cancel_poll([&]() { return ++polls >= 1; });
    LoadResult r = loader.load();

    assert(r.state.aborted);
    assert(polls == 1);
    assert(to_string(r.cache.primes()) == "[2, 3]");
    assert(r.state.files_loaded == 1);
}

int main(int argc, char *argv[])
{
    testEmptyDirectory();
    testCompleteFile();
    testIndexGapIgnored();
    testOverfilledFile();
    testPartialLastFile();
    testEmptyFileStopsLoading();
    testWindowsLineEndings();
    testStructuralCorruption();
    testIdempotentLoad();
    testMemoryLimitWhileLoading();
    testMemoryLimitInconsistentFiles();
    testCancellation();

    return 0;
}
