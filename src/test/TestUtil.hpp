#pragma once
#include <gmpxx.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

// Scratch directory removed on scope exit.
struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& name) {
        std::random_device rd;
        auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
        path = std::filesystem::temp_directory_path() /
               ("primegen-" + name + "-" + std::to_string(tick) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path file(const std::string& n) const { return path / n; }
};

inline void write_lines(const std::filesystem::path& p, const std::vector<std::string>& lines) {
    std::ofstream out(p, std::ios::out | std::ios::trunc);
    for (const auto& l : lines) out << l << "\n";
}

inline std::vector<std::string> read_lines(const std::filesystem::path& p) {
    std::vector<std::string> lines;
    std::ifstream in(p);
    std::string l;
    while (std::getline(in, l)) lines.push_back(l);
    return lines;
}

inline std::string to_string(const std::vector<std::string>& v) {
    std::stringstream ss;
    ss << "[";
    for (std::size_t i = 0; i < v.size(); i++) {
        if (i) ss << ", ";
        ss << v[i];
    }
    ss << "]";
    return ss.str();
}

inline std::string to_string(const std::vector<mpz_class>& v) {
    std::stringstream ss;
    ss << "[";
    for (std::size_t i = 0; i < v.size(); i++) {
        if (i) ss << ", ";
        ss << v[i];
    }
    ss << "]";
    return ss.str();
}

// Reference list by dividing with every integer up to the square root.
inline std::vector<mpz_class> reference_primes_below(unsigned long limit) {
    std::vector<mpz_class> ps;
    for (unsigned long n = 2; n < limit; n++) {
        bool prime = true;
        for (unsigned long d = 2; d * d <= n; d++) {
            if (n % d == 0) {
                prime = false;
                break;
            }
        }
        if (prime) ps.emplace_back(n);
    }
    return ps;
}

inline bool reference_is_prime(unsigned long n) {
    if (n < 2) return false;
    for (unsigned long d = 2; d * d <= n; d++) {
        if (n % d == 0) return false;
    }
    return true;
}
