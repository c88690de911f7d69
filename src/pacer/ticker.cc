#include "ticker.h"

#include "absl/time/time.h"

namespace ProducerPerf {

Ticker::Ticker(std::chrono::milliseconds interval)
	: interval_(interval),
	  thread_(&Ticker::TickLoop, this) {}

Ticker::~Ticker() {
	Stop();
	if (thread_.joinable()) {
		thread_.join();
	}
}

void Ticker::TickLoop() {
	absl::Duration interval = absl::FromChrono(interval_);
	absl::Time next = absl::Now() + interval;
	absl::MutexLock lock(&mu_);
	while (true) {
		// Sleeps until the deadline unless Stop() flips stopped_ first.
		if (mu_.AwaitWithDeadline(absl::Condition(&stopped_), next)) {
			return;
		}
		fired_++;
		if (pending_) {
			dropped_++;
		} else {
			pending_ = true;
		}
		next += interval;
		// Fixed rate, but never schedule ticks in the past after a stall.
		absl::Time now = absl::Now();
		if (next < now) {
			next = now + interval;
		}
	}
}

void Ticker::Wait() {
	absl::MutexLock lock(&mu_);
	mu_.Await(absl::Condition(this, &Ticker::TickPendingOrStopped));
	pending_ = false;
}

bool Ticker::TickPendingOrStopped() const {
	return pending_ || stopped_;
}

void Ticker::Stop() {
	absl::MutexLock lock(&mu_);
	stopped_ = true;
}

uint64_t Ticker::fired() const {
	absl::MutexLock lock(&mu_);
	return fired_;
}

uint64_t Ticker::dropped() const {
	absl::MutexLock lock(&mu_);
	return dropped_;
}

} // namespace ProducerPerf
