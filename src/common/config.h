#ifndef PRODUCER_PERF_CONFIG_H_
#define PRODUCER_PERF_CONFIG_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ProducerPerf {

enum class RunMode { kAsync, kSync };

/**
 * Settings handed to the producer client. Everything here is consumed by
 * KafkaProducerClient only; the core never looks at it.
 */
struct ProducerConfig {
    std::vector<std::string> brokers;
    std::string security_protocol = "PLAINTEXT";
    std::string tls_ca_certs;
    std::string tls_client_cert;
    std::string tls_client_key;
    int max_open_requests = 5;
    int max_message_bytes = 1000000;
    int required_acks = 1;
    std::chrono::milliseconds timeout{10000};
    std::string partitioner = "roundrobin";
    std::string compression = "none";
    std::chrono::milliseconds flush_frequency{0};
    int flush_bytes = 0;
    int flush_messages = 0;
    int flush_max_messages = 0;
    std::string client_id = "producer-perf";
    int channel_buffer_size = 256;
    std::string version = "0.8.2.0";
    bool verbose = false;
};

/**
 * One immutable value holding every tunable of a run. Built once by
 * Configuration::build() and passed explicitly to each component.
 */
struct BenchmarkConfig {
    RunMode mode = RunMode::kAsync;
    int64_t message_load = 0;
    size_t message_size = 0;
    std::string message_file;
    std::string message_decoder = "raw";
    int routines = 1;
    int throughput = 0;            // messages per second, 0 = unlimited
    std::string topic;
    int32_t partition = -1;        // -1 lets the client choose
    std::chrono::milliseconds report_interval{5000};
    ProducerConfig producer;
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_CONFIG_H_
