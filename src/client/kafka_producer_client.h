#ifndef PRODUCER_PERF_KAFKA_PRODUCER_CLIENT_H_
#define PRODUCER_PERF_KAFKA_PRODUCER_CLIENT_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <librdkafka/rdkafkacpp.h>
#include "folly/MPMCQueue.h"

#include "../common/config.h"
#include "producer_client.h"

namespace ProducerPerf {

/**
 * ProducerClient on top of librdkafka.
 *
 * One handle serves both delivery models: SendSync() attaches a waiter to
 * the message and blocks on it, SendAsync() leaves the report to be picked
 * up through AwaitCompletion(). A background thread polls the handle so
 * delivery callbacks run even while every sender is blocked.
 *
 * Delivery callbacks maintain the metrics read by the reporter:
 * record-send-rate, outgoing-byte-rate, request-latency-in-ms and
 * requests-in-flight. They are registered on first use.
 */
class KafkaProducerClient : public ProducerClient {
public:
	/**
	 * @throws ConfigurationError if librdkafka rejects a property
	 * @throws DeliveryError if the producer handle cannot be created
	 */
	explicit KafkaProducerClient(const ProducerConfig& config);
	~KafkaProducerClient() override;

	KafkaProducerClient(const KafkaProducerClient&) = delete;
	KafkaProducerClient& operator=(const KafkaProducerClient&) = delete;

	void SendAsync(const OutboundMessage& message) override;
	std::optional<DeliveryReport> AwaitCompletion(std::chrono::milliseconds timeout) override;
	DeliveryReport SendSync(const OutboundMessage& message) override;
	bool Close(std::string& errstr) override;
	const MetricsRegistry& Metrics() const override { return metrics_; }

private:
	class DeliveryReportHandler : public RdKafka::DeliveryReportCb {
	public:
		explicit DeliveryReportHandler(KafkaProducerClient* client) : client_(client) {}
		void dr_cb(RdKafka::Message& message) override;
	private:
		KafkaProducerClient* client_;
	};

	class EventHandler : public RdKafka::EventCb {
	public:
		void event_cb(RdKafka::Event& event) override;
	};

	class RoundRobinPartitioner : public RdKafka::PartitionerCb {
	public:
		int32_t partitioner_cb(const RdKafka::Topic* topic, const std::string* key,
				int32_t partition_cnt, void* msg_opaque) override;
	private:
		std::atomic<uint32_t> next_{0};
	};

	void Configure(RdKafka::Conf* conf, RdKafka::Conf* topic_conf);
	void OnDelivery(RdKafka::Message& message);
	// Blocks while the completion queue is full, drops the report once closing.
	void PushCompletion(DeliveryReport&& report);
	// Retries while the local queue is full; returns the final produce error.
	RdKafka::ErrorCode Produce(const OutboundMessage& message, void* opaque);
	int32_t TargetPartition(const OutboundMessage& message) const;
	void PollThread();

	const ProducerConfig config_;
	MetricsRegistry metrics_;
	folly::MPMCQueue<DeliveryReport> completions_;

	// Callbacks must outlive producer_
	DeliveryReportHandler dr_handler_;
	EventHandler event_handler_;
	RoundRobinPartitioner round_robin_;
	std::unique_ptr<RdKafka::Producer> producer_;

	std::atomic<bool> closing_{false};
	std::atomic<bool> stop_polling_{false};
	std::thread poll_thread_;
	bool closed_ = false;
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_KAFKA_PRODUCER_CLIENT_H_
