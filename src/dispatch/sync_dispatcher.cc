#include "sync_dispatcher.h"

#include <exception>
#include <future>
#include <thread>
#include <vector>

#include <glog/logging.h>

#include "../common/errors.h"
#include "../pacer/throughput_pacer.h"
#include "dispatch_plan.h"

namespace ProducerPerf {

SyncDispatcher::SyncDispatcher(const BenchmarkConfig& config, ProducerClient& client,
		MessageGenerator& generator, std::chrono::milliseconds window)
	: config_(config), client_(client), generator_(generator), window_(window) {}

void SyncDispatcher::Send(int id, const OutboundMessage& message) {
	DeliveryReport report = client_.SendSync(message);
	sent_.fetch_add(1, std::memory_order_relaxed);
	if (!report.ok()) {
		LOG(ERROR) << "Worker " << id << " failed to send message: " << report.error;
		throw DeliveryError("Failed to send message: " + report.error);
	}
}

void SyncDispatcher::RecordError(std::exception_ptr error) {
	absl::MutexLock lock(&mu_);
	if (!first_error_) {
		first_error_ = error;
	}
	stop_.store(true, std::memory_order_release);
}

int64_t SyncDispatcher::Worker(int id, MessageStream& stream) {
	ThroughputPacer pacer(config_.throughput, window_);
	int64_t delivered = 0;
	while (!stop_.load(std::memory_order_acquire)) {
		std::optional<OutboundMessage> message = stream.Next();
		if (!message.has_value()) {
			break;
		}
		if (!pacer.enabled()) {
			Send(id, *message);
			delivered++;
			continue;
		}
		for (int i = 0; i < pacer.throughput(); i++) {
			if (stop_.load(std::memory_order_acquire)) {
				return delivered;
			}
			Send(id, *message);
			delivered++;
		}
		pacer.AwaitNextWindow();
	}
	VLOG(2) << "Worker " << id << " done after " << delivered << " deliveries";
	return delivered;
}

DispatchResult SyncDispatcher::Run() {
	std::vector<int64_t> chunks = PlanChunks(config_.message_load, config_.routines);

	// All streams exist before the first worker starts sending.
	std::vector<std::unique_ptr<MessageStream>> streams;
	streams.reserve(chunks.size());
	for (int64_t chunk : chunks) {
		streams.push_back(generator_.Generate(GenerationJob{config_.topic, config_.partition, chunk}));
	}

	const size_t num_workers = chunks.size();
	std::vector<std::thread> threads;
	std::vector<std::promise<int64_t>> promises(num_workers);
	std::vector<std::future<int64_t>> futures;
	for (size_t i = 0; i < num_workers; i++) {
		futures.push_back(promises[i].get_future());
	}

	try {
		for (size_t i = 0; i < num_workers; i++) {
			threads.emplace_back([this, &streams, &promises, i]() {
				try {
					promises[i].set_value(Worker(static_cast<int>(i), *streams[i]));
				} catch (const std::exception& e) {
					VLOG(1) << "Worker " << i << " stopped: " << e.what();
					RecordError(std::current_exception());
					promises[i].set_exception(std::current_exception());
				}
			});
		}
	} catch (const std::exception& e) {
		LOG(ERROR) << "Failed to start worker " << threads.size() << " of " << num_workers << ": " << e.what();
		stop_.store(true, std::memory_order_release);
		for (auto& t : threads) {
			t.join();
		}
		throw;
	}
	for (auto& t : threads) {
		t.join();
	}

	{
		absl::MutexLock lock(&mu_);
		if (first_error_) {
			std::rethrow_exception(first_error_);
		}
	}

	DispatchResult result;
	for (auto& f : futures) {
		result.acknowledged += f.get();
	}

	result.sent = sent_.load();
	VLOG(1) << "Sync dispatch finished: " << num_workers << " workers, "
		<< result.acknowledged << " deliveries";
	return result;
}

} // namespace ProducerPerf
