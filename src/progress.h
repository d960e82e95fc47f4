#pragma once
#include <atomic>
#include <cstdint>

struct ProgressConfig {
	const std::atomic<std::uint64_t>* candidates_tested;	// bumped by the control thread per candidate
	const std::atomic<std::uint64_t>* primes_found;			// primes found in this run
	double report_every_sec;								// period to print progress
	unsigned threads;										// tester worker threads, for context
	std::atomic<bool>* stop_flag;							// set true to stop reporter
};

// Starts a detached reporter thread; zero work on the control thread.
// The counters and stop flag must outlive the process's use of them.
void start_generation_progress(const ProgressConfig& cfg);
