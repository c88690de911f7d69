#ifndef PRODUCER_PERF_TICKER_H_
#define PRODUCER_PERF_TICKER_H_

#include <chrono>
#include <cstdint>
#include <thread>

#include "absl/synchronization/mutex.h"

namespace ProducerPerf {

/**
 * Fires once per interval on its own thread. Holds at most one pending
 * tick: a tick that arrives while another is still unconsumed is dropped,
 * so a slow consumer never sees a burst of queued ticks.
 */
class Ticker {
public:
	explicit Ticker(std::chrono::milliseconds interval);
	~Ticker();

	Ticker(const Ticker&) = delete;
	Ticker& operator=(const Ticker&) = delete;

	// Blocks until a tick is pending, then consumes it.
	void Wait();

	// Stops ticking; further Wait() calls return immediately.
	void Stop();

	uint64_t fired() const;
	uint64_t dropped() const;

private:
	void TickLoop();
	bool TickPendingOrStopped() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

	const std::chrono::milliseconds interval_;
	mutable absl::Mutex mu_;
	bool pending_ ABSL_GUARDED_BY(mu_) = false;
	bool stopped_ ABSL_GUARDED_BY(mu_) = false;
	uint64_t fired_ ABSL_GUARDED_BY(mu_) = 0;
	uint64_t dropped_ ABSL_GUARDED_BY(mu_) = 0;
	std::thread thread_;
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_TICKER_H_
