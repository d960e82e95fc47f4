#include "config.h"

#include <limits>
#include <stdexcept>

const char* generator_usage() {
    return "usage: primegen [--capacity N] [--prefix S] [--extension S] [--dir PATH] [--threads T]\n"
           "                [--parallel-threshold N] [--cache-limit N] [--cache-bytes N]\n"
           "                [--progress-sec S] [--log-file PATH] [--help]\n";
}

std::string join_argv_for_log(int argc, char** argv) {
    std::string s;
    s.reserve(256);
    for (int i = 0; i < argc; ++i) {
        if (i) s.push_back(' ');
        const std::string a = argv[i];
        if (a.find_first_of(" \t\"") == std::string::npos && !a.empty()) {
            s += a;
            continue;
        }
        s.push_back('"');
        for (char c : a) {
            if (c == '"') s += "\\\"";
            else s.push_back(c);
        }
        s.push_back('"');
    }
    return s;
}

static unsigned long long parse_count(const std::string& key, const std::string& v,
                                      unsigned long long lo, unsigned long long hi) {
    std::size_t used = 0;
    unsigned long long n = 0;
    try {
        if (v.empty() || v[0] == '-') throw std::invalid_argument(v);
        n = std::stoull(v, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("--" + key + ": expected a non-negative integer, got '" + v + "'");
    }
    if (used != v.size() || n < lo || n > hi) {
        throw std::invalid_argument("--" + key + ": value '" + v + "' out of range [" + std::to_string(lo) + ", " +
                                    std::to_string(hi) + "]");
    }
    return n;
}

static double parse_seconds(const std::string& key, const std::string& v) {
    std::size_t used = 0;
    double d = 0.0;
    try {
        d = std::stod(v, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("--" + key + ": expected seconds, got '" + v + "'");
    }
    if (used != v.size() || !(d >= 0.0)) {
        throw std::invalid_argument("--" + key + ": expected seconds >= 0, got '" + v + "'");
    }
    return d;
}

GeneratorConfig parse_generator_args(int argc, char** argv) {
    GeneratorConfig cfg;
    const auto size_max = static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max());

    for (int i = 1; i < argc; i++) {
        std::string s(argv[i]);
        if (s.compare(0, 2, "--") != 0) {
            throw std::invalid_argument("unexpected argument '" + s + "'");
        }
        s.erase(0, 2);

        if (s == "help") {
            cfg.help = true;
            continue;
        }

        std::string key = s, val;
        auto eq = s.find('=');
        if (eq != std::string::npos) {
            key = s.substr(0, eq);
            val = s.substr(eq + 1);
        } else if (i + 1 < argc) {
            val = argv[++i];
        } else {
            throw std::invalid_argument("--" + key + ": missing value");
        }

        if (key == "capacity") {
            cfg.layout.capacity = static_cast<std::size_t>(parse_count(key, val, 1, size_max));
        } else if (key == "prefix") {
            if (val.empty()) throw std::invalid_argument("--prefix: must not be empty");
            cfg.layout.prefix = val;
        } else if (key == "extension") {
            if (!val.empty() && val[0] != '.') val.insert(val.begin(), '.');
            cfg.layout.extension = val;
        } else if (key == "dir") {
            if (val.empty()) throw std::invalid_argument("--dir: must not be empty");
            cfg.dir = val;
        } else if (key == "threads") {
            cfg.threads = static_cast<unsigned>(parse_count(key, val, 1, 4096));
        } else if (key == "parallel-threshold") {
            cfg.parallel_threshold = static_cast<std::size_t>(parse_count(key, val, 0, size_max));
        } else if (key == "cache-limit") {
            cfg.budget.max_primes = static_cast<std::size_t>(parse_count(key, val, 0, size_max));
        } else if (key == "cache-bytes") {
            cfg.budget.max_bytes = static_cast<std::size_t>(parse_count(key, val, 0, size_max));
        } else if (key == "progress-sec") {
            cfg.progress_sec = parse_seconds(key, val);
        } else if (key == "log-file") {
            cfg.log_file = val;
        } else {
            throw std::invalid_argument("unknown option '--" + key + "'");
        }
    }
    return cfg;
}
