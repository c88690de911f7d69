#include "throughput_pacer.h"

#include <glog/logging.h>

namespace ProducerPerf {

ThroughputPacer::ThroughputPacer(int throughput, std::chrono::milliseconds window)
	: throughput_(throughput > 0 ? throughput : 0) {
	if (throughput_ > 0) {
		ticker_ = std::make_unique<Ticker>(window);
		VLOG(2) << "Pacing to " << throughput_ << " messages per " << window.count() << " ms";
	}
}

void ThroughputPacer::Throttle() {
	if (!enabled()) return;
	emitted_++;
	if (emitted_ % static_cast<uint64_t>(throughput_) == 0) {
		AwaitNextWindow();
	}
}

void ThroughputPacer::AwaitNextWindow() {
	if (!enabled()) return;
	waits_++;
	ticker_->Wait();
}

} // namespace ProducerPerf
