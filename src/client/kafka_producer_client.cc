#include "kafka_producer_client.h"

#include <algorithm>
#include <future>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "../common/errors.h"

namespace ProducerPerf {

namespace {

constexpr int kPollTimeoutMs = 100;

void SetProperty(RdKafka::Conf* conf, const std::string& name, const std::string& value) {
	std::string errstr;
	if (conf->set(name, value, errstr) != RdKafka::Conf::CONF_OK) {
		LOG(ERROR) << "Failed to set " << name << "=" << value << ": " << errstr;
		throw ConfigurationError(absl::StrCat("Invalid configuration: ", name, ": ", errstr));
	}
}

std::string AcksProperty(int required_acks) {
	return required_acks < 0 ? "all" : std::to_string(required_acks);
}

// Waiter attached to a synchronously produced message
struct SyncSend {
	std::promise<DeliveryReport> promise;
};

} // namespace

//----------------------------------------------------------------------------
// Callbacks
//----------------------------------------------------------------------------

void KafkaProducerClient::DeliveryReportHandler::dr_cb(RdKafka::Message& message) {
	client_->OnDelivery(message);
}

void KafkaProducerClient::EventHandler::event_cb(RdKafka::Event& event) {
	switch (event.type()) {
		case RdKafka::Event::EVENT_ERROR:
			LOG(ERROR) << "Kafka client error: " << RdKafka::err2str(event.err())
				<< " (" << event.str() << ")";
			break;
		case RdKafka::Event::EVENT_LOG:
			LOG(INFO) << "[" << event.fac() << "] " << event.str();
			break;
		case RdKafka::Event::EVENT_THROTTLE:
			VLOG(1) << "Throttled " << event.throttle_time() << " ms by broker " << event.broker_name();
			break;
		default:
			VLOG(2) << "Kafka client event " << event.type() << ": " << event.str();
			break;
	}
}

int32_t KafkaProducerClient::RoundRobinPartitioner::partitioner_cb(const RdKafka::Topic* topic,
		const std::string* key, int32_t partition_cnt, void* msg_opaque) {
	(void)key;
	(void)msg_opaque;
	if (partition_cnt <= 0) {
		return RdKafka::Topic::PARTITION_UA;
	}
	uint32_t n = next_.fetch_add(1, std::memory_order_relaxed);
	int32_t partition = static_cast<int32_t>(n % static_cast<uint32_t>(partition_cnt));
	if (!topic->partition_available(partition)) {
		VLOG(3) << "Round robin partition " << partition << " of " << topic->name() << " unavailable";
	}
	return partition;
}

//----------------------------------------------------------------------------
// KafkaProducerClient
//----------------------------------------------------------------------------

KafkaProducerClient::KafkaProducerClient(const ProducerConfig& config)
	: config_(config),
	  completions_(static_cast<size_t>(std::max(config.channel_buffer_size, 1))),
	  dr_handler_(this) {
	std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
	std::unique_ptr<RdKafka::Conf> topic_conf(RdKafka::Conf::create(RdKafka::Conf::CONF_TOPIC));
	Configure(conf.get(), topic_conf.get());

	std::string errstr;
	producer_.reset(RdKafka::Producer::create(conf.get(), errstr));
	if (!producer_) {
		LOG(ERROR) << "Failed to create producer: " << errstr;
		throw DeliveryError("Failed to create producer: " + errstr);
	}
	LOG(INFO) << "Created producer " << producer_->name() << " for "
		<< absl::StrJoin(config_.brokers, ",");

	poll_thread_ = std::thread(&KafkaProducerClient::PollThread, this);
}

KafkaProducerClient::~KafkaProducerClient() {
	if (!closed_) {
		std::string errstr;
		if (!Close(errstr)) {
			LOG(ERROR) << "Failed to close producer: " << errstr;
		}
	}
}

void KafkaProducerClient::Configure(RdKafka::Conf* conf, RdKafka::Conf* topic_conf) {
	SetProperty(conf, "bootstrap.servers", absl::StrJoin(config_.brokers, ","));
	SetProperty(conf, "client.id", config_.client_id);
	SetProperty(conf, "max.in.flight.requests.per.connection", std::to_string(config_.max_open_requests));
	SetProperty(conf, "message.max.bytes", std::to_string(config_.max_message_bytes));
	SetProperty(conf, "compression.codec", config_.compression);
	SetProperty(conf, "linger.ms", std::to_string(config_.flush_frequency.count()));
	if (config_.flush_bytes > 0) {
		SetProperty(conf, "batch.size", std::to_string(config_.flush_bytes));
	}
	if (config_.flush_max_messages > 0) {
		SetProperty(conf, "batch.num.messages", std::to_string(config_.flush_max_messages));
	} else if (config_.flush_messages > 0) {
		SetProperty(conf, "batch.num.messages", std::to_string(config_.flush_messages));
	}
	SetProperty(conf, "broker.version.fallback", config_.version);

	if (config_.security_protocol == "SSL") {
		SetProperty(conf, "security.protocol", "ssl");
		if (!config_.tls_ca_certs.empty()) {
			// Use specific root CA set vs the host's set
			SetProperty(conf, "ssl.ca.location", config_.tls_ca_certs);
		}
		if (!config_.tls_client_cert.empty()) {
			SetProperty(conf, "ssl.certificate.location", config_.tls_client_cert);
			SetProperty(conf, "ssl.key.location", config_.tls_client_key);
		}
	} else {
		SetProperty(conf, "security.protocol", "plaintext");
	}

	if (config_.verbose) {
		SetProperty(conf, "debug", "broker,topic,msg");
	}

	std::string errstr;
	if (conf->set("dr_cb", &dr_handler_, errstr) != RdKafka::Conf::CONF_OK ||
			conf->set("event_cb", &event_handler_, errstr) != RdKafka::Conf::CONF_OK) {
		throw ConfigurationError("Invalid configuration: " + errstr);
	}

	// Topic level
	SetProperty(topic_conf, "acks", AcksProperty(config_.required_acks));
	SetProperty(topic_conf, "request.timeout.ms", std::to_string(config_.timeout.count()));
	if (config_.partitioner == "hash") {
		SetProperty(topic_conf, "partitioner", "murmur2_random");
	} else if (config_.partitioner == "random") {
		SetProperty(topic_conf, "partitioner", "random");
	} else if (config_.partitioner == "roundrobin") {
		if (topic_conf->set("partitioner_cb", &round_robin_, errstr) != RdKafka::Conf::CONF_OK) {
			throw ConfigurationError("Invalid configuration: " + errstr);
		}
	}
	// "manual" needs nothing: messages carry an explicit partition.
	if (conf->set("default_topic_conf", topic_conf, errstr) != RdKafka::Conf::CONF_OK) {
		throw ConfigurationError("Invalid configuration: " + errstr);
	}
}

int32_t KafkaProducerClient::TargetPartition(const OutboundMessage& message) const {
	if (config_.partitioner == "manual" && message.partition >= 0) {
		return message.partition;
	}
	return RdKafka::Topic::PARTITION_UA;
}

RdKafka::ErrorCode KafkaProducerClient::Produce(const OutboundMessage& message, void* opaque) {
	char* payload = message.payload ? const_cast<char*>(message.payload->data()) : nullptr;
	// Counted before produce() so the delivery callback never sees it negative.
	auto in_flight = metrics_.GetOrRegister<Counter>(kRequestsInFlight);
	in_flight->Inc(1);
	while (true) {
		RdKafka::ErrorCode err = producer_->produce(
			message.topic,
			TargetPartition(message),
			RdKafka::Producer::RK_MSG_COPY,
			payload,
			message.size(),
			NULL, 0,
			0,
			opaque
		);
		if (err != RdKafka::ERR__QUEUE_FULL) {
			if (err != RdKafka::ERR_NO_ERROR) {
				in_flight->Dec(1);
			}
			return err;
		}
		// Local queue full: serve delivery reports to make room.
		producer_->poll(1);
	}
}

void KafkaProducerClient::SendAsync(const OutboundMessage& message) {
	RdKafka::ErrorCode err = Produce(message, nullptr);
	if (err != RdKafka::ERR_NO_ERROR) {
		// Rejected before it was queued; report it like a failed delivery.
		DeliveryReport report;
		report.partition = message.partition;
		report.error = "Failed to produce message: " + RdKafka::err2str(err);
		PushCompletion(std::move(report));
	}
}

std::optional<DeliveryReport> KafkaProducerClient::AwaitCompletion(std::chrono::milliseconds timeout) {
	DeliveryReport report;
	if (!completions_.tryReadUntil(std::chrono::steady_clock::now() + timeout, report)) {
		return std::nullopt;
	}
	return report;
}

void KafkaProducerClient::PushCompletion(DeliveryReport&& report) {
	while (!completions_.tryWriteUntil(std::chrono::steady_clock::now() + std::chrono::milliseconds(kPollTimeoutMs),
				std::move(report))) {
		if (closing_.load(std::memory_order_acquire)) {
			// Nobody is collecting any more.
			VLOG(1) << "Dropping delivery report during close: " << (report.ok() ? "ok" : report.error);
			return;
		}
	}
}

DeliveryReport KafkaProducerClient::SendSync(const OutboundMessage& message) {
	SyncSend waiter;
	std::future<DeliveryReport> result = waiter.promise.get_future();
	RdKafka::ErrorCode err = Produce(message, &waiter);
	if (err != RdKafka::ERR_NO_ERROR) {
		DeliveryReport report;
		report.partition = message.partition;
		report.error = "Failed to produce message: " + RdKafka::err2str(err);
		return report;
	}
	return result.get();
}

void KafkaProducerClient::OnDelivery(RdKafka::Message& message) {
	metrics_.GetOrRegister<Counter>(kRequestsInFlight)->Dec(1);

	DeliveryReport report;
	report.partition = message.partition();
	report.offset = message.offset();
	if (message.err()) {
		report.error = message.errstr();
	} else {
		metrics_.GetOrRegister<Meter>(kRecordSendRate)->Mark(1);
		metrics_.GetOrRegister<Meter>(kOutgoingByteRate)->Mark(static_cast<int64_t>(message.len()));
		metrics_.GetOrRegister<Histogram>(kRequestLatencyInMs)->Update(message.latency() / 1000);
	}

	if (message.msg_opaque() != nullptr) {
		static_cast<SyncSend*>(message.msg_opaque())->promise.set_value(std::move(report));
	} else {
		PushCompletion(std::move(report));
	}
}

void KafkaProducerClient::PollThread() {
	while (!stop_polling_.load(std::memory_order_acquire)) {
		producer_->poll(kPollTimeoutMs);
	}
}

bool KafkaProducerClient::Close(std::string& errstr) {
	if (closed_) {
		return true;
	}
	closed_ = true;
	closing_.store(true, std::memory_order_release);

	bool ok = true;
	RdKafka::ErrorCode err = producer_->flush(static_cast<int>(config_.timeout.count()));
	if (err != RdKafka::ERR_NO_ERROR) {
		errstr = absl::StrCat(RdKafka::err2str(err), ": ", producer_->outq_len(),
				" messages still in queue");
		ok = false;
	}

	stop_polling_.store(true, std::memory_order_release);
	if (poll_thread_.joinable()) {
		poll_thread_.join();
	}
	producer_.reset();
	VLOG(1) << "Producer closed";
	return ok;
}

} // namespace ProducerPerf
