#include <iostream>
#include <assert.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "../config.h"

// builds a mutable argv the way main() receives it
static GeneratorConfig parse(std::vector<std::string> args)
{
    std::vector<char*> argv;
    std::string prog = "primegen";
    argv.push_back(prog.data());
    for (auto& a : args) argv.push_back(a.data());
    return parse_generator_args(static_cast<int>(argv.size()), argv.data());
}

static bool rejects(std::vector<std::string> args)
{
    try {
        parse(std::move(args));
    } catch (const std::invalid_argument& e) {
        std::cout << "Rejected: " << e.what() << "\n";
        return true;
    }
    return false;
}

void testDefaults()
{
    std::cout << "----- testDefaults() ----------------------\n";

    GeneratorConfig cfg = parse({});
    assert(cfg.layout.capacity == 10000);
    assert(cfg.layout.prefix == "PrimeNumbers");
    assert(cfg.layout.extension == ".txt");
    assert(cfg.dir == ".");
    assert(cfg.threads == 0);
    assert(cfg.budget.max_primes == 0 && cfg.budget.max_bytes == 0);
    assert(cfg.progress_sec == 60.0);
    assert(cfg.log_file.empty());
    assert(!cfg.help);
}

void testOptions()
{
    std::cout << "----- testOptions() -----------------------\n";

    GeneratorConfig cfg = parse({"--capacity", "5", "--prefix=Run", "--extension", "dat", "--dir", "/tmp/x",
                                 "--threads=3", "--cache-limit", "1000", "--cache-bytes=4096",
                                 "--progress-sec", "0", "--log-file", "run.log", "--parallel-threshold=7"});
    assert(cfg.layout.capacity == 5);
    assert(cfg.layout.prefix == "Run");
    assert(cfg.layout.extension == ".dat");
    assert(cfg.dir == "/tmp/x");
    assert(cfg.threads == 3);
    assert(cfg.budget.max_primes == 1000);
    assert(cfg.budget.max_bytes == 4096);
    assert(cfg.progress_sec == 0.0);
    assert(cfg.log_file == "run.log");
    assert(cfg.parallel_threshold == 7);

    assert(parse({"--help"}).help);
}

void testRejects()
{
    std::cout << "----- testRejects() -----------------------\n";

    assert(rejects({"--capacity", "0"}));
    assert(rejects({"--capacity", "-4"}));
    assert(rejects({"--capacity", "12x"}));
    assert(rejects({"--threads", "0"}));
    assert(rejects({"--progress-sec", "-1"}));
    assert(rejects({"--prefix="}));
    assert(rejects({"--bogus", "1"}));
    assert(rejects({"positional"}));
    assert(rejects({"--capacity"}));
}

void testJoinArgv()
{
    std::cout << "----- testJoinArgv() ----------------------\n";

    std::vector<std::string> args = {"primegen", "--dir", "my primes", "--prefix", "a\"b"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());

    std::string actual = join_argv_for_log(static_cast<int>(argv.size()), argv.data());
    std::string expect = "primegen --dir \"my primes\" --prefix \"a\\\"b\"";
    std::cout << "ACTUAL: " << actual << "\n";
    std::cout << "EXPECT: " << expect << "\n";
    assert(actual == expect);
}

int main(int argc, char *argv[])
{
    testDefaults();
    testOptions();
    testRejects();
    testJoinArgv();

    return 0;
}
