#include <gmpxx.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <typeinfo>

#include "ReportFile.h"
#include "config.h"
#include "errors.h"
#include "generation_engine.h"
#include "primality.h"
#include "progress.h"
#include "result_store.h"

// set from the signal handler, polled once per candidate
static std::atomic<bool> g_cancel{false};
static std::atomic<bool> g_stop_progress{false};
static GenerationCounters g_counters;

extern "C" void on_stop_signal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

class ConsoleListener : public GenerationListener {
public:
    void on_load_started() override {
        std::cerr << "[load] loading primes from existing result files\n";
    }

    void on_load_progress(std::size_t ordinal, std::size_t total) override {
        std::cerr << "[load] file " << ordinal << "/" << total << "\n";
    }

    void on_load_finished(std::size_t primes_loaded, std::size_t files_loaded) override {
        if (files_loaded == 0) {
            std::cerr << "[load] no result files loaded, starting from scratch\n";
        } else {
            std::cerr << "[load] loaded " << primes_loaded << " primes from " << files_loaded << " files\n";
        }
    }

    void on_generation_started() override {
        std::cerr << "[gen] generating prime numbers...\n";
    }

    void on_checkpoint_written(const CheckpointWritten& ev) override {
        double secs = std::chrono::duration<double>(ev.since_last_write).count();
        std::cout << ev.file_index << ". Wrote primes #" << (ev.first_prime + 1) << " to #" << (ev.last_prime + 1)
                  << " to file at " << ReportFile::iso_utc(ev.written_at) << " (generation time: " << std::fixed
                  << std::setprecision(3) << secs << " sec)." << std::endl;
    }
};

static std::string failure_report(const std::exception& ex, const GenerationEngine* engine) {
    std::ostringstream os;
    os << "Time: " << ReportFile::iso_utc_now() << "\n";

    const auto* pe = dynamic_cast<const PrimeGenError*>(&ex);
    os << "Error: " << (pe ? pe->kind() : typeid(ex).name()) << "\n";
    os << "Message: " << ex.what() << "\n";

    if (pe && pe->has_candidate()) {
        os << "Current number to check: " << pe->candidate() << "\n";
    } else if (engine) {
        os << "Current number to check: " << engine->current_candidate() << "\n";
    }
    if (engine) {
        os << "Phase: " << phase_name(engine->phase()) << "\n";
    }
    if (const auto* se = dynamic_cast<const StorageError*>(&ex)) {
        os << "Result file index: " << se->file_index() << "\n";
        os << "Result file path: " << se->file_path().string() << "\n";
    }
    return os.str();
}

int main(int argc, char** argv) {
    GeneratorConfig cfg;
    try {
        cfg = parse_generator_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << generator_usage();
        return 2;
    }
    if (cfg.help) {
        std::cout << generator_usage();
        return 0;
    }

    std::error_code ec;
    std::filesystem::create_directories(cfg.dir, ec);
    if (ec) {
        std::cerr << "[error] cannot create storage directory " << cfg.dir.string() << ": " << ec.message() << "\n";
        return 1;
    }

    ReportFile::set_default_dir(cfg.dir);
    if (!cfg.log_file.empty()) ReportFile::set_path(cfg.log_file);
    if (!ReportFile::append_line(ReportFile::iso_utc_now() + " start: " + join_argv_for_log(argc, argv))) {
        std::cerr << "[error] cannot write report file " << ReportFile::get_path() << "\n";
    }

    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);

    int rc = 0;
    // declaration order = reverse destruction order; the engine refers to the other two
    ConsoleListener console;
    std::unique_ptr<ResultStore> store;
    std::unique_ptr<PrimalityTester> tester;
    std::unique_ptr<GenerationEngine> engine;
    try {
        store = std::make_unique<ResultStore>(cfg.dir, cfg.layout);
        tester = std::make_unique<PrimalityTester>(cfg.threads, cfg.parallel_threshold);
        engine = std::make_unique<GenerationEngine>(*store, *tester, cfg.budget);

        engine->add_listener(&console);
        engine->set_cancel_poll([]() { return g_cancel.load(std::memory_order_relaxed); });
        engine->set_counters(&g_counters);

        std::cerr << "[gen] capacity=" << cfg.layout.capacity << " dir=" << cfg.dir.string()
                  << " threads=" << tester->threads() << " cache_limit=" << cfg.budget.max_primes
                  << " cache_bytes=" << cfg.budget.max_bytes << "\n";
        std::cout << "Press Ctrl+C to stop." << std::endl;

        if (cfg.progress_sec > 0.0) {
            ProgressConfig pcfg{
                    &g_counters.candidates_tested,
                    &g_counters.primes_found,
                    cfg.progress_sec,
                    tester->threads(),
                    &g_stop_progress
            };
            start_generation_progress(pcfg);
        }

        engine->run();

        std::ostringstream os;
        os << ReportFile::iso_utc_now() << " stopped: next number to check " << engine->current_candidate()
           << ", " << engine->cache().size() << " primes in memory";
        if (!ReportFile::append_line(os.str())) {
            std::cerr << "[error] cannot write report file " << ReportFile::get_path() << "\n";
        }
        std::cerr << "[gen] stopped at " << engine->current_candidate() << "\n";
    } catch (const std::exception& ex) {
        const std::string report = failure_report(ex, engine.get());
        if (!ReportFile::append_block(report)) {
            std::cerr << report;
        }
        std::cerr << "[error] " << ex.what() << " (details in " << ReportFile::get_path() << ")\n";
        rc = 1;
    }

    g_stop_progress.store(true, std::memory_order_relaxed);
    return rc;
}
