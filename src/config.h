#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

#include "prime_cache.h"
#include "result_store.h"

// Everything the command line can set.
struct GeneratorConfig {
    StoreLayout layout;
    std::filesystem::path dir = ".";
    unsigned threads = 0;					// 0 = hardware concurrency
    std::size_t parallel_threshold = 4096;
    CacheBudget budget;
    double progress_sec = 60.0;				// 0 = no progress lines
    std::string log_file;					// empty = PRIMEGEN_LOG_FILE or default
    bool help = false;
};

// Accepts --key value and --key=value. Throws std::invalid_argument on
// unknown options, missing values and out-of-range numbers.
GeneratorConfig parse_generator_args(int argc, char** argv);

const char* generator_usage();

// Join argv into a single, reproducible command line for logging.
std::string join_argv_for_log(int argc, char** argv);
