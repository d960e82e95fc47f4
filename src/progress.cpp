#include "progress.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <thread>

void start_generation_progress(const ProgressConfig& cfg){
	std::thread([cfg](){
		using clock = std::chrono::steady_clock;
		const double period = (cfg.report_every_sec > 0.1 ? cfg.report_every_sec : 10.0);

		std::uint64_t prev = cfg.candidates_tested ? cfg.candidates_tested->load(std::memory_order_relaxed) : 0;
		auto t0 = clock::now();
		auto last = t0;

		std::cerr << "[progress] reporting every " << period << " s; T=" << cfg.threads << "\n";

		while(cfg.stop_flag && !cfg.stop_flag->load(std::memory_order_relaxed)){
			std::this_thread::sleep_for(std::chrono::duration<double>(period));
			if (cfg.stop_flag->load(std::memory_order_relaxed)) break;

			auto now = clock::now();
			double dt = std::chrono::duration<double>(now - last).count();
			if (dt <= 0.0) continue;

			std::uint64_t cur = cfg.candidates_tested ? cfg.candidates_tested->load(std::memory_order_relaxed) : 0;
			std::uint64_t found = cfg.primes_found ? cfg.primes_found->load(std::memory_order_relaxed) : 0;
			std::uint64_t d = (cur >= prev ? (cur - prev) : 0);

			double t_total = std::chrono::duration<double>(now - t0).count();

			std::cerr << "[progress] t=" << t_total
					  << " s; tested=" << cur
					  << "; tested/s=" << (d / dt)
					  << "; primes_found=" << found
					  << "\n";

			prev = cur;
			last = now;
		}
		std::cerr << "[progress] reporter stopped.\n";
	}).detach();
}
