#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/common/configuration.h"
#include "../../src/common/errors.h"

#include <cstdlib>
#include <cstring>
#include <memory>

using namespace ProducerPerf;
using ::testing::Contains;
using ::testing::HasSubstr;

namespace {

const char* kMinimalYaml = R"(
producer_perf:
  run:
    message_load: 1000
    message_size: 128
    topic: bench
  producer:
    brokers: localhost:9092
)";

} // namespace

class ConfigurationTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("PRODUCER_PERF_TOPIC");
        unsetenv("PRODUCER_PERF_SYNC");
        unsetenv("PRODUCER_PERF_ROUTINES");
    }

    // Parses args as if given on the command line after the program name.
    void ApplyCommandLine(const std::vector<std::string>& args) {
        cxxopts::Options options("producer-perf", "test");
        Configuration::addCommandLineOptions(options);

        std::vector<std::unique_ptr<char[]>> storage;
        std::vector<char*> argv;
        storage.emplace_back(new char[std::strlen("producer-perf") + 1]);
        std::strcpy(storage.back().get(), "producer-perf");
        argv.push_back(storage.back().get());
        for (const auto& arg : args) {
            storage.emplace_back(new char[arg.size() + 1]);
            std::strcpy(storage.back().get(), arg.c_str());
            argv.push_back(storage.back().get());
        }
        int argc = static_cast<int>(argv.size());
        char** argv_ptr = argv.data();
        auto result = options.parse(argc, argv_ptr);
        config_.overrideFromCommandLine(result);
    }

    Configuration config_;
};

TEST_F(ConfigurationTest, DefaultsAreIncomplete) {
    EXPECT_FALSE(config_.validate());
    auto errors = config_.getValidationErrors();
    EXPECT_THAT(errors, Contains("-brokers is required"));
    EXPECT_THAT(errors, Contains("-topic is required"));
    EXPECT_THAT(errors, Contains("-message-load must be greater than 0"));
    EXPECT_THAT(errors, Contains("one of -message-size or -message-file must be set"));
}

TEST_F(ConfigurationTest, BuildFromYaml) {
    ASSERT_TRUE(config_.loadFromString(kMinimalYaml));
    BenchmarkConfig built = config_.build();

    EXPECT_EQ(built.mode, RunMode::kAsync);
    EXPECT_EQ(built.message_load, 1000);
    EXPECT_EQ(built.message_size, 128u);
    EXPECT_EQ(built.topic, "bench");
    EXPECT_EQ(built.partition, -1);
    EXPECT_EQ(built.routines, 1);
    EXPECT_EQ(built.throughput, 0);
    EXPECT_EQ(built.producer.brokers, std::vector<std::string>({"localhost:9092"}));
    EXPECT_EQ(built.producer.required_acks, 1);
    EXPECT_EQ(built.producer.timeout, std::chrono::seconds(10));
    EXPECT_EQ(built.producer.partitioner, "roundrobin");
    EXPECT_EQ(built.producer.compression, "none");
    EXPECT_EQ(built.producer.client_id, "producer-perf");
    EXPECT_EQ(built.producer.channel_buffer_size, 256);
    EXPECT_EQ(built.producer.version, "0.8.2.0");
}

TEST_F(ConfigurationTest, BrokersAsYamlSequence) {
    ASSERT_TRUE(config_.loadFromString(R"(
producer_perf:
  run: {message_load: 10, message_size: 1, topic: t}
  producer:
    brokers: [a:9092, b:9092]
)"));
    EXPECT_EQ(config_.build().producer.brokers, std::vector<std::string>({"a:9092", "b:9092"}));
}

TEST_F(ConfigurationTest, InvalidYamlIsRejected) {
    EXPECT_FALSE(config_.loadFromString("producer_perf: [unterminated"));
}

TEST_F(ConfigurationTest, CommandLineOverridesYaml) {
    ASSERT_TRUE(config_.loadFromString(kMinimalYaml));
    ApplyCommandLine({"--topic", "other", "--sync", "--routines", "4", "--brokers", "x:1, y:2",
                      "--timeout", "250ms", "--required-acks=-1"});
    BenchmarkConfig built = config_.build();

    EXPECT_EQ(built.topic, "other");
    EXPECT_EQ(built.mode, RunMode::kSync);
    EXPECT_EQ(built.routines, 4);
    EXPECT_EQ(built.producer.brokers, std::vector<std::string>({"x:1", "y:2"}));
    EXPECT_EQ(built.producer.timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(built.producer.required_acks, -1);
    // Untouched by the command line
    EXPECT_EQ(built.message_load, 1000);
}

TEST_F(ConfigurationTest, EnvironmentOverridesYamlButNotCommandLine) {
    ASSERT_TRUE(config_.loadFromString(kMinimalYaml));
    setenv("PRODUCER_PERF_TOPIC", "from-env", 1);
    setenv("PRODUCER_PERF_SYNC", "yes", 1);
    EXPECT_EQ(config_.build().topic, "from-env");
    EXPECT_EQ(config_.build().mode, RunMode::kSync);

    ApplyCommandLine({"--topic", "from-flag"});
    EXPECT_EQ(config_.build().topic, "from-flag");
}

TEST_F(ConfigurationTest, UnparsableEnvironmentValueIsIgnored) {
    ASSERT_TRUE(config_.loadFromString(kMinimalYaml));
    setenv("PRODUCER_PERF_ROUTINES", "many", 1);
    EXPECT_EQ(config_.build().routines, 1);
}

TEST_F(ConfigurationTest, RejectsUnknownSchemes) {
    ASSERT_TRUE(config_.loadFromString(kMinimalYaml));
    auto& s = config_.settings();
    s.run.message_decoder.set("zlib");
    s.producer.partitioner.set("sticky");
    s.producer.compression.set("zstd");
    s.producer.version.set("latest");

    EXPECT_FALSE(config_.validate());
    auto errors = config_.getValidationErrors();
    EXPECT_THAT(errors, Contains("Unknown -message-decoder: zlib"));
    EXPECT_THAT(errors, Contains("Unknown -partitioning: sticky"));
    EXPECT_THAT(errors, Contains("Unknown -compression: zstd"));
    EXPECT_THAT(errors, Contains("unknown -version: latest"));
}

TEST_F(ConfigurationTest, ManualPartitioningNeedsPartition) {
    ASSERT_TRUE(config_.loadFromString(kMinimalYaml));
    config_.settings().producer.partitioner.set("manual");
    EXPECT_FALSE(config_.validate());
    EXPECT_THAT(config_.getValidationErrors(), Contains("-partition must not be -1 for -partitioning=manual"));

    config_.settings().run.partition.set(2);
    EXPECT_TRUE(config_.validate());
    EXPECT_EQ(config_.build().partition, 2);
}

TEST_F(ConfigurationTest, RoutinesBoundedByLoad) {
    ASSERT_TRUE(config_.loadFromString(kMinimalYaml));
    config_.settings().run.routines.set(1001);
    EXPECT_FALSE(config_.validate());
    config_.settings().run.routines.set(0);
    EXPECT_FALSE(config_.validate());
}

TEST_F(ConfigurationTest, TlsClientCertNeedsKey) {
    ASSERT_TRUE(config_.loadFromString(kMinimalYaml));
    config_.settings().producer.security_protocol.set("SSL");
    config_.settings().producer.tls_client_cert.set("/etc/client.pem");
    EXPECT_FALSE(config_.validate());
    config_.settings().producer.tls_client_key.set("/etc/client.key");
    EXPECT_TRUE(config_.validate());
}

TEST_F(ConfigurationTest, BuildThrowsConfigurationError) {
    try {
        config_.build();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_THAT(e.what(), HasSubstr("-brokers is required; "));
        EXPECT_EQ(e.exit_code(), kExitUsage);
    }
}

TEST(ParseDurationMsTest, GoStyleDurations) {
    EXPECT_EQ(ParseDurationMs("10s"), std::chrono::milliseconds(10000));
    EXPECT_EQ(ParseDurationMs("250ms"), std::chrono::milliseconds(250));
    EXPECT_EQ(ParseDurationMs("1m30s"), std::chrono::milliseconds(90000));
    EXPECT_EQ(ParseDurationMs("0"), std::chrono::milliseconds(0));
    EXPECT_FALSE(ParseDurationMs("ten seconds").has_value());
    EXPECT_FALSE(ParseDurationMs("-1s").has_value());
}

TEST(KafkaVersionTest, DottedNumericVersions) {
    EXPECT_TRUE(IsValidKafkaVersion("0.8.2.0"));
    EXPECT_TRUE(IsValidKafkaVersion("2.1.0"));
    EXPECT_TRUE(IsValidKafkaVersion("1.0"));
    EXPECT_FALSE(IsValidKafkaVersion("2"));
    EXPECT_FALSE(IsValidKafkaVersion("2.x.0"));
    EXPECT_FALSE(IsValidKafkaVersion("1.2.3.4.5"));
}
