#ifndef PRODUCER_PERF_CONFIGURATION_H_
#define PRODUCER_PERF_CONFIGURATION_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "config.h"

namespace YAML {
class Node;
}

namespace ProducerPerf {

/**
 * Configuration value that can be overridden by environment variables.
 * A value set from the command line wins over the environment.
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!from_command_line_ && !env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    void setFromCommandLine(T value) {
        value_ = value;
        from_command_line_ = true;
    }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;
    bool from_command_line_ = false;

    std::optional<T> getEnvValue() const;
};

/**
 * Raw, unvalidated settings. Durations and broker lists are kept in their
 * textual form until Build().
 */
struct ProducerPerfSettings {
    struct Run {
        ConfigValue<bool> sync{false, "PRODUCER_PERF_SYNC"};
        ConfigValue<int64_t> message_load{0, "PRODUCER_PERF_MESSAGE_LOAD"};
        ConfigValue<int> message_size{0, "PRODUCER_PERF_MESSAGE_SIZE"};
        ConfigValue<std::string> message_file{"", "PRODUCER_PERF_MESSAGE_FILE"};
        ConfigValue<std::string> message_decoder{"raw", "PRODUCER_PERF_MESSAGE_DECODER"};
        ConfigValue<int> routines{1, "PRODUCER_PERF_ROUTINES"};
        ConfigValue<int> throughput{0, "PRODUCER_PERF_THROUGHPUT"};
        ConfigValue<std::string> topic{"", "PRODUCER_PERF_TOPIC"};
        ConfigValue<int> partition{-1, "PRODUCER_PERF_PARTITION"};
        ConfigValue<int> report_interval_ms{5000, "PRODUCER_PERF_REPORT_INTERVAL_MS"};
    } run;

    struct Producer {
        ConfigValue<std::string> brokers{"", "PRODUCER_PERF_BROKERS"};
        ConfigValue<std::string> security_protocol{"PLAINTEXT", "PRODUCER_PERF_SECURITY_PROTOCOL"};
        ConfigValue<std::string> tls_ca_certs{"", "PRODUCER_PERF_TLS_CA_CERTS"};
        ConfigValue<std::string> tls_client_cert{"", "PRODUCER_PERF_TLS_CLIENT_CERT"};
        ConfigValue<std::string> tls_client_key{"", "PRODUCER_PERF_TLS_CLIENT_KEY"};
        ConfigValue<int> max_open_requests{5, "PRODUCER_PERF_MAX_OPEN_REQUESTS"};
        ConfigValue<int> max_message_bytes{1000000, "PRODUCER_PERF_MAX_MESSAGE_BYTES"};
        ConfigValue<int> required_acks{1, "PRODUCER_PERF_REQUIRED_ACKS"};
        ConfigValue<std::string> timeout{"10s", "PRODUCER_PERF_TIMEOUT"};
        ConfigValue<std::string> partitioner{"roundrobin", "PRODUCER_PERF_PARTITIONER"};
        ConfigValue<std::string> compression{"none", "PRODUCER_PERF_COMPRESSION"};
        ConfigValue<std::string> flush_frequency{"0s", "PRODUCER_PERF_FLUSH_FREQUENCY"};
        ConfigValue<int> flush_bytes{0, "PRODUCER_PERF_FLUSH_BYTES"};
        ConfigValue<int> flush_messages{0, "PRODUCER_PERF_FLUSH_MESSAGES"};
        ConfigValue<int> flush_max_messages{0, "PRODUCER_PERF_FLUSH_MAX_MESSAGES"};
        ConfigValue<std::string> client_id{"producer-perf", "PRODUCER_PERF_CLIENT_ID"};
        ConfigValue<int> channel_buffer_size{256, "PRODUCER_PERF_CHANNEL_BUFFER_SIZE"};
        ConfigValue<std::string> version{"0.8.2.0", "PRODUCER_PERF_VERSION"};
        ConfigValue<bool> verbose{false, "PRODUCER_PERF_VERBOSE"};
    } producer;
};

/**
 * Collects settings from defaults, a YAML file, the environment and the
 * command line, and freezes them into a BenchmarkConfig.
 */
class Configuration {
public:
    Configuration() = default;

    // Registers every command line option understood by overrideFromCommandLine()
    static void addCommandLineOptions(cxxopts::Options& options);

    // Load configuration from file (root key "producer_perf")
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with parsed command line arguments
    void overrideFromCommandLine(const cxxopts::ParseResult& result);

    const ProducerPerfSettings& settings() const { return settings_; }
    ProducerPerfSettings& settings() { return settings_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    /**
     * Validates and returns the immutable run configuration.
     * @throws ConfigurationError listing every validation failure
     */
    BenchmarkConfig build() const;

private:
    ProducerPerfSettings settings_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

/**
 * Parses a Go style duration ("10s", "250ms", "1m30s").
 * @return std::nullopt if the text is not a duration
 */
std::optional<std::chrono::milliseconds> ParseDurationMs(const std::string& text);

/**
 * Accepts dotted numeric broker versions such as "0.8.2.0" or "2.1.0".
 */
bool IsValidKafkaVersion(const std::string& version);

} // namespace ProducerPerf

#endif // PRODUCER_PERF_CONFIGURATION_H_
