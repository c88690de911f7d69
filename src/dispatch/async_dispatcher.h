#ifndef PRODUCER_PERF_ASYNC_DISPATCHER_H_
#define PRODUCER_PERF_ASYNC_DISPATCHER_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "absl/synchronization/mutex.h"

#include "../client/producer_client.h"
#include "../common/config.h"
#include "../generator/message_generator.h"
#include "dispatcher.h"

namespace ProducerPerf {

/**
 * Fire-and-forget dispatch. A single sender streams message_load messages
 * into the client, throttled by one pacer, while a collector thread counts
 * delivery reports until it has seen message_load of them. The first
 * failed report aborts the run.
 */
class AsyncDispatcher : public Dispatcher {
public:
	AsyncDispatcher(const BenchmarkConfig& config, ProducerClient& client, MessageGenerator& generator,
			std::chrono::milliseconds window = std::chrono::seconds(1));

	DispatchResult Run() override;

private:
	void CollectReports(int64_t expected);
	void Fail(const std::string& error);

	const BenchmarkConfig& config_;
	ProducerClient& client_;
	MessageGenerator& generator_;
	const std::chrono::milliseconds window_;

	std::atomic<bool> failed_{false};
	// Set once the sender gives up; the collector then waits only for what was sent.
	std::atomic<bool> sending_done_{false};
	std::atomic<int64_t> sent_{0};
	std::atomic<int64_t> acknowledged_{0};

	absl::Mutex mu_;
	std::string first_error_ ABSL_GUARDED_BY(mu_);
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_ASYNC_DISPATCHER_H_
