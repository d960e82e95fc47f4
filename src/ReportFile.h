#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <cstdlib>
#include <filesystem>
#include <ctime>        // gmtime_r / gmtime_s

// Append-only run log shared by the whole process.
class ReportFile {
public:
    static constexpr const char* default_name = "GeneratorFailureLog.txt";

    static void set_path(const std::string& p) {
        std::lock_guard<std::mutex> g(mu());
        path() = p;
    }

    // Directory used when neither set_path nor PRIMEGEN_LOG_FILE chose a file.
    static void set_default_dir(const std::filesystem::path& d) {
        std::lock_guard<std::mutex> g(mu());
        default_dir() = d;
    }

    static std::string get_path() {
        std::lock_guard<std::mutex> g(mu());
        ensure_initialized_unlocked();
        return path();
    }

    // Thread-safe append (creates parent dir if missing). false if the file can't be opened.
    static bool append_line(const std::string& line) {
        return append_block(line + '\n');
    }

    // Thread-safe append block (no extra newline).
    static bool append_block(const std::string& block) {
        std::lock_guard<std::mutex> g(mu());
        ensure_initialized_unlocked();
        ensure_parent_dir_unlocked();
        std::ofstream out(path(), std::ios::out | std::ios::app);
        if (!out) return false;
        out << block;
        return static_cast<bool>(out);
    }

    // UTC timestamp like 2025-08-16 14:32:05Z
    static std::string iso_utc(std::chrono::system_clock::time_point tp) {
        const std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
#if defined(_WIN32)
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif
        std::ostringstream os;
        os << std::put_time(&tm, "%Y-%m-%d %H:%M:%SZ");
        return os.str();
    }

    static std::string iso_utc_now() {
        return iso_utc(std::chrono::system_clock::now());
    }

private:
    static std::mutex& mu() {
        static std::mutex m;
        return m;
    }
    static std::string& path() {
        static std::string p; // lazily filled
        return p;
    }
    static std::filesystem::path& default_dir() {
        static std::filesystem::path d;
        return d;
    }

    // Ensure path() is set exactly once, with precedence:
    // 1) set_path (--log-file)
    // 2) env PRIMEGEN_LOG_FILE, relative to the working directory
    // 3) default_name inside default_dir(), or the working directory
    static void ensure_initialized_unlocked() {
        if (!path().empty()) return;

        namespace fs = std::filesystem;
        std::error_code ec;

        if (const char* envp = std::getenv("PRIMEGEN_LOG_FILE")) {
            fs::path envpath = envp;
            if (!envpath.is_absolute()) {
                auto cwd = fs::current_path(ec);
                envpath = (cwd / envpath);
            }
            path() = envpath.lexically_normal().string();
            return;
        }

        fs::path dir = default_dir();
        if (dir.empty()) {
            dir = fs::current_path(ec);
        }
        path() = (dir / default_name).string();
    }

    static void ensure_parent_dir_unlocked() {
        namespace fs = std::filesystem;
        std::error_code ec;

        const std::string cur = path();  // snapshot
        fs::path pth{ cur };             // braces avoid most-vexing-parse
        fs::path parent = pth.has_parent_path() ? pth.parent_path() : fs::path(".");
        if (!fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
        }
    }
};
