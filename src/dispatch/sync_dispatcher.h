#ifndef PRODUCER_PERF_SYNC_DISPATCHER_H_
#define PRODUCER_PERF_SYNC_DISPATCHER_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

#include "absl/synchronization/mutex.h"

#include "../client/producer_client.h"
#include "../common/config.h"
#include "../generator/message_generator.h"
#include "dispatcher.h"

namespace ProducerPerf {

/**
 * Blocking dispatch across config.routines workers. Each worker owns a
 * stream of its PlanChunks() share and its own pacer, and waits for every
 * delivery before sending the next message.
 *
 * With pacing enabled a worker sends each message it draws throughput
 * times in a row and then waits for the next window, so one drawn message
 * yields throughput deliveries.
 *
 * The first failure stops all workers; Run() rethrows it once every worker
 * has returned.
 */
class SyncDispatcher : public Dispatcher {
public:
	SyncDispatcher(const BenchmarkConfig& config, ProducerClient& client, MessageGenerator& generator,
			std::chrono::milliseconds window = std::chrono::seconds(1));

	DispatchResult Run() override;

private:
	// Returns the number of successful deliveries.
	int64_t Worker(int id, MessageStream& stream);
	void Send(int id, const OutboundMessage& message);
	// Keeps the earliest failure and tells every worker to stop.
	void RecordError(std::exception_ptr error);

	const BenchmarkConfig& config_;
	ProducerClient& client_;
	MessageGenerator& generator_;
	const std::chrono::milliseconds window_;

	std::atomic<bool> stop_{false};
	std::atomic<int64_t> sent_{0};

	absl::Mutex mu_;
	std::exception_ptr first_error_ ABSL_GUARDED_BY(mu_);
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_SYNC_DISPATCHER_H_
