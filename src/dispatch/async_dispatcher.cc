#include "async_dispatcher.h"

#include <exception>
#include <memory>
#include <thread>

#include <glog/logging.h>

#include "../common/errors.h"
#include "../pacer/throughput_pacer.h"

namespace ProducerPerf {

namespace {
constexpr std::chrono::milliseconds kCollectPoll(100);
}

AsyncDispatcher::AsyncDispatcher(const BenchmarkConfig& config, ProducerClient& client,
		MessageGenerator& generator, std::chrono::milliseconds window)
	: config_(config), client_(client), generator_(generator), window_(window) {}

void AsyncDispatcher::Fail(const std::string& error) {
	absl::MutexLock lock(&mu_);
	if (first_error_.empty()) {
		first_error_ = error;
	}
	failed_.store(true, std::memory_order_release);
}

void AsyncDispatcher::CollectReports(int64_t expected) {
	int64_t seen = 0;
	bool failed = false;
	while (seen < expected) {
		bool done = sending_done_.load(std::memory_order_acquire);
		if (done && seen >= sent_.load(std::memory_order_acquire)) {
			break;
		}
		std::optional<DeliveryReport> report = client_.AwaitCompletion(kCollectPoll);
		if (!report.has_value()) {
			if (failed && done) {
				break;
			}
			continue;
		}
		seen++;
		if (!report->ok()) {
			if (!failed) {
				LOG(ERROR) << "Delivery failed on partition " << report->partition << ": " << report->error;
				Fail(report->error);
				failed = true;
			}
			// Keep draining so a sender blocked on a full completion queue can finish.
			continue;
		}
		if (!failed) {
			acknowledged_.fetch_add(1, std::memory_order_relaxed);
		}
	}
	VLOG(1) << "Collector observed " << seen << " of " << expected << " delivery reports";
}

DispatchResult AsyncDispatcher::Run() {
	const int64_t load = config_.message_load;
	std::unique_ptr<MessageStream> stream = generator_.Generate(
			GenerationJob{config_.topic, config_.partition, load});
	ThroughputPacer pacer(config_.throughput, window_);

	std::thread collector(&AsyncDispatcher::CollectReports, this, load);

	std::exception_ptr send_error;
	try {
		while (!failed_.load(std::memory_order_acquire)) {
			std::optional<OutboundMessage> message = stream->Next();
			if (!message.has_value()) {
				break;
			}
			client_.SendAsync(*message);
			sent_.fetch_add(1, std::memory_order_release);
			pacer.Throttle();
		}
	} catch (const std::exception& e) {
		LOG(ERROR) << "Async send loop aborted: " << e.what();
		send_error = std::current_exception();
	}
	sending_done_.store(true, std::memory_order_release);
	collector.join();
	// Stops the writer if the loop left early
	stream.reset();

	if (failed_.load(std::memory_order_acquire)) {
		absl::MutexLock lock(&mu_);
		throw DeliveryError("Failed to send message: " + first_error_);
	}
	if (send_error) {
		std::rethrow_exception(send_error);
	}

	DispatchResult result;
	result.sent = sent_.load();
	result.acknowledged = acknowledged_.load();
	VLOG(1) << "Async dispatch finished: " << result.sent << " sent, "
		<< result.acknowledged << " acknowledged";
	return result;
}

} // namespace ProducerPerf
