#include "configuration.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/time/time.h"

#include "errors.h"

namespace ProducerPerf {

namespace {

const std::vector<std::string> kDecoderSchemes = {"raw", "hex", "base64"};
const std::vector<std::string> kPartitioners = {"hash", "manual", "random", "roundrobin"};
const std::vector<std::string> kCompressionCodecs = {"none", "gzip", "snappy", "lz4"};
const std::vector<std::string> kSecurityProtocols = {"PLAINTEXT", "SSL"};

bool Contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

template<typename T>
void SetIfPresent(const YAML::Node& node, const char* key, ConfigValue<T>& value) {
    if (node[key]) value.set(node[key].as<T>());
}

template<typename T>
void OverrideIfPresent(const cxxopts::ParseResult& result, const char* key, ConfigValue<T>& value) {
    if (result.count(key)) value.setFromCommandLine(result[key].as<T>());
}

} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> ParseDurationMs(const std::string& text) {
    absl::Duration d;
    if (!absl::ParseDuration(text, &d) || d < absl::ZeroDuration()) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(absl::ToInt64Milliseconds(d));
}

bool IsValidKafkaVersion(const std::string& version) {
    std::vector<std::string> parts = absl::StrSplit(version, '.');
    if (parts.size() < 2 || parts.size() > 4) return false;
    for (const auto& part : parts) {
        int n;
        if (part.empty() || !absl::SimpleAtoi(part, &n) || n < 0) return false;
    }
    return true;
}

void Configuration::addCommandLineOptions(cxxopts::Options& options) {
    options.add_options()
        ("config", "YAML file with defaults for every option below", cxxopts::value<std::string>())
        ("sync", "Use a synchronous producer.")
        ("message-load", "REQUIRED: The number of messages to produce to -topic.",
            cxxopts::value<int64_t>())
        ("message-size", "(OR -message-file) The approximate size (in bytes) of each message to produce to -topic.",
            cxxopts::value<int>())
        ("message-file", "(OR -message-size) The file holding the payload of messages, one message per line.",
            cxxopts::value<std::string>())
        ("message-decoder", "The decoder for the message lines in the -message-file (raw, hex, base64).",
            cxxopts::value<std::string>())
        ("brokers", "REQUIRED: A comma separated list of broker addresses.", cxxopts::value<std::string>())
        ("security-protocol", "The name of the security protocol to talk to Kafka (PLAINTEXT, SSL).",
            cxxopts::value<std::string>())
        ("tls-ca-certs", "PEM file with the root certificate authorities to trust when -security-protocol=SSL "
            "(leave empty to use the host's root CA set).", cxxopts::value<std::string>())
        ("tls-client-cert", "PEM file with the client certificate when -security-protocol=SSL "
            "(leave empty to disable client authentication).", cxxopts::value<std::string>())
        ("tls-client-key", "PEM file with the client private key (REQUIRED if tls-client-cert is provided).",
            cxxopts::value<std::string>())
        ("topic", "REQUIRED: The topic to run the performance test on.", cxxopts::value<std::string>())
        ("partition", "The partition of -topic to run the performance test on.", cxxopts::value<int>())
        ("throughput", "The maximum number of messages to send per second (0 for no limit).",
            cxxopts::value<int>())
        ("max-open-requests", "The maximum number of unacknowledged requests the client will send on a "
            "single connection before blocking.", cxxopts::value<int>())
        ("max-message-bytes", "The max permitted size of a message.", cxxopts::value<int>())
        ("required-acks", "The required number of acks needed from the broker (-1: all, 0: none, 1: local).",
            cxxopts::value<int>())
        ("timeout", "The duration the producer will wait to receive -required-acks.",
            cxxopts::value<std::string>())
        ("partitioner", "The partitioning scheme to use (hash, manual, random, roundrobin).",
            cxxopts::value<std::string>())
        ("compression", "The compression method to use (none, gzip, snappy, lz4).",
            cxxopts::value<std::string>())
        ("flush-frequency", "The best-effort frequency of flushes.", cxxopts::value<std::string>())
        ("flush-bytes", "The best-effort number of bytes needed to trigger a flush.", cxxopts::value<int>())
        ("flush-messages", "The best-effort number of messages needed to trigger a flush.",
            cxxopts::value<int>())
        ("flush-max-messages", "The maximum number of messages the producer will send in a single request.",
            cxxopts::value<int>())
        ("client-id", "The client ID sent with every request to the brokers.", cxxopts::value<std::string>())
        ("channel-buffer-size", "The number of delivery reports to buffer before the client blocks.",
            cxxopts::value<int>())
        ("routines", "The number of routines to send the messages from (-sync only).", cxxopts::value<int>())
        ("version", "The assumed version of Kafka.", cxxopts::value<std::string>())
        ("verbose", "Turn on client logging to stderr")
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["producer_perf"]) {
        LOG(WARNING) << "Configuration has no producer_perf section, nothing loaded";
        return;
    }
    auto root = yaml["producer_perf"];

    if (root["run"]) {
        auto run = root["run"];
        SetIfPresent(run, "sync", settings_.run.sync);
        SetIfPresent(run, "message_load", settings_.run.message_load);
        SetIfPresent(run, "message_size", settings_.run.message_size);
        SetIfPresent(run, "message_file", settings_.run.message_file);
        SetIfPresent(run, "message_decoder", settings_.run.message_decoder);
        SetIfPresent(run, "routines", settings_.run.routines);
        SetIfPresent(run, "throughput", settings_.run.throughput);
        SetIfPresent(run, "topic", settings_.run.topic);
        SetIfPresent(run, "partition", settings_.run.partition);
        SetIfPresent(run, "report_interval_ms", settings_.run.report_interval_ms);
    }

    if (root["producer"]) {
        auto producer = root["producer"];
        if (producer["brokers"] && producer["brokers"].IsSequence()) {
            std::vector<std::string> brokers;
            for (const auto& broker : producer["brokers"]) {
                brokers.push_back(broker.as<std::string>());
            }
            settings_.producer.brokers.set(absl::StrJoin(brokers, ","));
        } else {
            SetIfPresent(producer, "brokers", settings_.producer.brokers);
        }
        SetIfPresent(producer, "security_protocol", settings_.producer.security_protocol);
        SetIfPresent(producer, "tls_ca_certs", settings_.producer.tls_ca_certs);
        SetIfPresent(producer, "tls_client_cert", settings_.producer.tls_client_cert);
        SetIfPresent(producer, "tls_client_key", settings_.producer.tls_client_key);
        SetIfPresent(producer, "max_open_requests", settings_.producer.max_open_requests);
        SetIfPresent(producer, "max_message_bytes", settings_.producer.max_message_bytes);
        SetIfPresent(producer, "required_acks", settings_.producer.required_acks);
        SetIfPresent(producer, "timeout", settings_.producer.timeout);
        SetIfPresent(producer, "partitioner", settings_.producer.partitioner);
        SetIfPresent(producer, "compression", settings_.producer.compression);
        SetIfPresent(producer, "flush_frequency", settings_.producer.flush_frequency);
        SetIfPresent(producer, "flush_bytes", settings_.producer.flush_bytes);
        SetIfPresent(producer, "flush_messages", settings_.producer.flush_messages);
        SetIfPresent(producer, "flush_max_messages", settings_.producer.flush_max_messages);
        SetIfPresent(producer, "client_id", settings_.producer.client_id);
        SetIfPresent(producer, "channel_buffer_size", settings_.producer.channel_buffer_size);
        SetIfPresent(producer, "version", settings_.producer.version);
        SetIfPresent(producer, "verbose", settings_.producer.verbose);
    }
}

void Configuration::overrideFromCommandLine(const cxxopts::ParseResult& result) {
    if (result.count("sync")) settings_.run.sync.setFromCommandLine(true);
    OverrideIfPresent(result, "message-load", settings_.run.message_load);
    OverrideIfPresent(result, "message-size", settings_.run.message_size);
    OverrideIfPresent(result, "message-file", settings_.run.message_file);
    OverrideIfPresent(result, "message-decoder", settings_.run.message_decoder);
    OverrideIfPresent(result, "routines", settings_.run.routines);
    OverrideIfPresent(result, "throughput", settings_.run.throughput);
    OverrideIfPresent(result, "topic", settings_.run.topic);
    OverrideIfPresent(result, "partition", settings_.run.partition);

    OverrideIfPresent(result, "brokers", settings_.producer.brokers);
    OverrideIfPresent(result, "security-protocol", settings_.producer.security_protocol);
    OverrideIfPresent(result, "tls-ca-certs", settings_.producer.tls_ca_certs);
    OverrideIfPresent(result, "tls-client-cert", settings_.producer.tls_client_cert);
    OverrideIfPresent(result, "tls-client-key", settings_.producer.tls_client_key);
    OverrideIfPresent(result, "max-open-requests", settings_.producer.max_open_requests);
    OverrideIfPresent(result, "max-message-bytes", settings_.producer.max_message_bytes);
    OverrideIfPresent(result, "required-acks", settings_.producer.required_acks);
    OverrideIfPresent(result, "timeout", settings_.producer.timeout);
    OverrideIfPresent(result, "partitioner", settings_.producer.partitioner);
    OverrideIfPresent(result, "compression", settings_.producer.compression);
    OverrideIfPresent(result, "flush-frequency", settings_.producer.flush_frequency);
    OverrideIfPresent(result, "flush-bytes", settings_.producer.flush_bytes);
    OverrideIfPresent(result, "flush-messages", settings_.producer.flush_messages);
    OverrideIfPresent(result, "flush-max-messages", settings_.producer.flush_max_messages);
    OverrideIfPresent(result, "client-id", settings_.producer.client_id);
    OverrideIfPresent(result, "channel-buffer-size", settings_.producer.channel_buffer_size);
    OverrideIfPresent(result, "version", settings_.producer.version);
    if (result.count("verbose")) settings_.producer.verbose.setFromCommandLine(true);
}

bool Configuration::validate() const {
    validation_errors_.clear();
    const auto& run = settings_.run;
    const auto& producer = settings_.producer;

    // Required parameters
    if (producer.brokers.get().empty()) {
        validation_errors_.push_back("-brokers is required");
    }
    if (run.topic.get().empty()) {
        validation_errors_.push_back("-topic is required");
    }
    if (run.message_load.get() <= 0) {
        validation_errors_.push_back("-message-load must be greater than 0");
    }
    if (run.message_size.get() <= 0 && run.message_file.get().empty()) {
        validation_errors_.push_back("one of -message-size or -message-file must be set");
    }
    if (run.routines.get() < 1 || run.routines.get() > run.message_load.get()) {
        validation_errors_.push_back("-routines must be greater than 0 and less than or equal to -message-load");
    }
    if (run.throughput.get() < 0) {
        validation_errors_.push_back("-throughput must not be negative");
    }
    if (run.report_interval_ms.get() < 1) {
        validation_errors_.push_back("report_interval_ms must be at least 1");
    }

    // Scheme names
    if (!Contains(kDecoderSchemes, run.message_decoder.get())) {
        validation_errors_.push_back("Unknown -message-decoder: " + run.message_decoder.get());
    }
    if (!Contains(kSecurityProtocols, producer.security_protocol.get())) {
        validation_errors_.push_back("-security-protocol \"" + producer.security_protocol.get() +
                                     "\" is not supported");
    }
    if (!producer.tls_client_cert.get().empty() && producer.tls_client_key.get().empty()) {
        validation_errors_.push_back("-tls-client-key is required when -tls-client-cert is set");
    }
    if (!Contains(kPartitioners, producer.partitioner.get())) {
        validation_errors_.push_back("Unknown -partitioning: " + producer.partitioner.get());
    } else if (producer.partitioner.get() == "manual" && run.partition.get() < 0) {
        validation_errors_.push_back("-partition must not be -1 for -partitioning=manual");
    }
    if (!Contains(kCompressionCodecs, producer.compression.get())) {
        validation_errors_.push_back("Unknown -compression: " + producer.compression.get());
    }
    if (!IsValidKafkaVersion(producer.version.get())) {
        validation_errors_.push_back("unknown -version: " + producer.version.get());
    }

    // Producer tunables
    if (!ParseDurationMs(producer.timeout.get()).has_value()) {
        validation_errors_.push_back("Invalid -timeout: " + producer.timeout.get());
    }
    if (!ParseDurationMs(producer.flush_frequency.get()).has_value()) {
        validation_errors_.push_back("Invalid -flush-frequency: " + producer.flush_frequency.get());
    }
    int acks = producer.required_acks.get();
    if (acks < -1 || acks > 1) {
        validation_errors_.push_back("-required-acks must be -1, 0 or 1");
    }
    if (producer.max_open_requests.get() < 1) {
        validation_errors_.push_back("-max-open-requests must be at least 1");
    }
    if (producer.max_message_bytes.get() < 1) {
        validation_errors_.push_back("-max-message-bytes must be at least 1");
    }
    if (producer.channel_buffer_size.get() < 1) {
        validation_errors_.push_back("-channel-buffer-size must be at least 1");
    }
    if (producer.flush_bytes.get() < 0 || producer.flush_messages.get() < 0 ||
        producer.flush_max_messages.get() < 0) {
        validation_errors_.push_back("-flush-bytes, -flush-messages and -flush-max-messages must not be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

BenchmarkConfig Configuration::build() const {
    if (!validate()) {
        throw ConfigurationError(absl::StrJoin(validation_errors_, "; "));
    }
    const auto& run = settings_.run;
    const auto& producer = settings_.producer;

    BenchmarkConfig config;
    config.mode = run.sync.get() ? RunMode::kSync : RunMode::kAsync;
    config.message_load = run.message_load.get();
    config.message_size = run.message_size.get() > 0 ? static_cast<size_t>(run.message_size.get()) : 0;
    config.message_file = run.message_file.get();
    config.message_decoder = run.message_decoder.get();
    config.routines = run.routines.get();
    config.throughput = run.throughput.get();
    config.topic = run.topic.get();
    config.partition = run.partition.get();
    config.report_interval = std::chrono::milliseconds(run.report_interval_ms.get());

    ProducerConfig& p = config.producer;
    for (absl::string_view broker : absl::StrSplit(producer.brokers.get(), ',', absl::SkipWhitespace())) {
        p.brokers.push_back(std::string(absl::StripAsciiWhitespace(broker)));
    }
    p.security_protocol = producer.security_protocol.get();
    p.tls_ca_certs = producer.tls_ca_certs.get();
    p.tls_client_cert = producer.tls_client_cert.get();
    p.tls_client_key = producer.tls_client_key.get();
    p.max_open_requests = producer.max_open_requests.get();
    p.max_message_bytes = producer.max_message_bytes.get();
    p.required_acks = producer.required_acks.get();
    p.timeout = *ParseDurationMs(producer.timeout.get());
    p.partitioner = producer.partitioner.get();
    p.compression = producer.compression.get();
    p.flush_frequency = *ParseDurationMs(producer.flush_frequency.get());
    p.flush_bytes = producer.flush_bytes.get();
    p.flush_messages = producer.flush_messages.get();
    p.flush_max_messages = producer.flush_max_messages.get();
    p.client_id = producer.client_id.get();
    p.channel_buffer_size = producer.channel_buffer_size.get();
    p.version = producer.version.get();
    p.verbose = producer.verbose.get();
    return config;
}

} // namespace ProducerPerf
