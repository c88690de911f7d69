#ifndef PRODUCER_PERF_THROUGHPUT_PACER_H_
#define PRODUCER_PERF_THROUGHPUT_PACER_H_

#include <chrono>
#include <cstdint>
#include <memory>

#include "ticker.h"

namespace ProducerPerf {

/**
 * Best-effort cap on the number of messages a single sender emits per
 * window. After every throughput-th message Throttle() waits for the next
 * window tick. Ticks that arrive while the sender is busy are coalesced,
 * so there is no catch-up after a stall and no exact spacing.
 *
 * A throughput of 0 disables pacing: no ticker is started and neither
 * Throttle() nor AwaitNextWindow() ever blocks.
 * @threading Owned by one sender.
 */
class ThroughputPacer {
public:
	explicit ThroughputPacer(int throughput,
			std::chrono::milliseconds window = std::chrono::seconds(1));

	bool enabled() const { return ticker_ != nullptr; }
	int throughput() const { return throughput_; }

	// Call after each emitted message.
	void Throttle();

	// Waits for the next window regardless of the message count.
	void AwaitNextWindow();

	uint64_t emitted() const { return emitted_; }
	uint64_t waits() const { return waits_; }

private:
	const int throughput_;
	std::unique_ptr<Ticker> ticker_;
	uint64_t emitted_ = 0;
	uint64_t waits_ = 0;
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_THROUGHPUT_PACER_H_
