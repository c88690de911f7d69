#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/dispatch/benchmark_runner.h"
#include "../../src/common/errors.h"
#include "../client/fake_producer_client.h"

#include <new>
#include <sstream>
#include <system_error>

using namespace ProducerPerf;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

// Hands the runner a client whose state outlives the run.
class ForwardingClient : public ProducerClient {
public:
    explicit ForwardingClient(FakeProducerClient& target) : target_(target) {}

    void SendAsync(const OutboundMessage& message) override { target_.SendAsync(message); }
    std::optional<DeliveryReport> AwaitCompletion(std::chrono::milliseconds timeout) override {
        return target_.AwaitCompletion(timeout);
    }
    DeliveryReport SendSync(const OutboundMessage& message) override { return target_.SendSync(message); }
    bool Close(std::string& errstr) override { return target_.Close(errstr); }
    const MetricsRegistry& Metrics() const override { return target_.Metrics(); }

private:
    FakeProducerClient& target_;
};

// Fails like the runtime would when no more threads can be started.
class ThreadExhaustedClient : public FakeProducerClient {
public:
    void SendAsync(const OutboundMessage&) override {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                "thread creation failed");
    }
    DeliveryReport SendSync(const OutboundMessage&) override {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                "thread creation failed");
    }
};

int CountLines(const std::string& text) {
    int lines = 0;
    for (char c : text) {
        if (c == '\n') lines++;
    }
    return lines;
}

} // namespace

class BenchmarkRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.message_load = 100;
        config_.message_size = 16;
        config_.topic = "bench";
        config_.producer.brokers = {"localhost:9092"};
        // No periodic lines during a test run
        config_.report_interval = std::chrono::hours(1);
    }

    ProducerClientFactory FactoryFor(FakeProducerClient& client) {
        return [&client](const ProducerConfig&) {
            return std::make_unique<ForwardingClient>(client);
        };
    }

    BenchmarkConfig config_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(BenchmarkRunnerTest, AsyncRunPrintsFinalLineOnce) {
    FakeProducerClient client;
    int code = RunBenchmark(config_, FactoryFor(client), out_, err_);

    EXPECT_EQ(code, kExitOk);
    EXPECT_EQ(client.sends(), 100);
    EXPECT_EQ(client.awaited(), 100);
    EXPECT_EQ(client.close_calls(), 1);
    EXPECT_EQ(CountLines(out_.str()), 1);
    EXPECT_THAT(out_.str(), StartsWith("100 records sent, "));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(BenchmarkRunnerTest, SyncRunUsesAllRoutines) {
    config_.mode = RunMode::kSync;
    config_.routines = 4;
    FakeProducerClient client;
    int code = RunBenchmark(config_, FactoryFor(client), out_, err_);

    EXPECT_EQ(code, kExitOk);
    EXPECT_EQ(client.sends(), 100);
    EXPECT_EQ(CountLines(out_.str()), 1);
}

TEST_F(BenchmarkRunnerTest, DeliveryFailureExitsWithFailureCode) {
    FakeProducerClient client(/*fail_at=*/10);
    int code = RunBenchmark(config_, FactoryFor(client), out_, err_);

    EXPECT_EQ(code, kExitFailure);
    EXPECT_THAT(err_.str(), StartsWith("ERROR: Failed to send message: "));
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(BenchmarkRunnerTest, CloseFailureExitsWithFailureCode) {
    FakeProducerClient client;
    client.set_close_error("Local: Timed out: 3 messages still in queue");
    int code = RunBenchmark(config_, FactoryFor(client), out_, err_);

    EXPECT_EQ(code, kExitFailure);
    EXPECT_EQ(err_.str(), "ERROR: Failed to close producer: Local: Timed out: 3 messages still in queue\n");
    // The metrics were already complete before closing.
    EXPECT_EQ(CountLines(out_.str()), 1);
}

TEST_F(BenchmarkRunnerTest, ClientCreationFailure) {
    ProducerClientFactory factory = [](const ProducerConfig&) -> std::unique_ptr<ProducerClient> {
        throw DeliveryError("Failed to create producer: no brokers reachable");
    };
    int code = RunBenchmark(config_, factory, out_, err_);

    EXPECT_EQ(code, kExitFailure);
    EXPECT_EQ(err_.str(), "ERROR: Failed to create producer: no brokers reachable\n");
}

TEST_F(BenchmarkRunnerTest, UnknownDecoderIsUsageError) {
    config_.message_file = "/nonexistent/producer_perf/messages.txt";
    config_.message_decoder = "zlib";
    FakeProducerClient client;
    int code = RunBenchmark(config_, FactoryFor(client), out_, err_);

    EXPECT_EQ(code, kExitUsage);
    EXPECT_THAT(err_.str(), HasSubstr("Unknown -message-decoder: zlib"));
    EXPECT_EQ(client.sends(), 0);
}

TEST_F(BenchmarkRunnerTest, FactorySeesProducerSettings) {
    config_.producer.client_id = "perf-42";
    FakeProducerClient client;
    std::string seen_client_id;
    ProducerClientFactory factory = [&](const ProducerConfig& producer) {
        seen_client_id = producer.client_id;
        return std::make_unique<ForwardingClient>(client);
    };
    EXPECT_EQ(RunBenchmark(config_, factory, out_, err_), kExitOk);
    EXPECT_EQ(seen_client_id, "perf-42");
}

TEST_F(BenchmarkRunnerTest, RuntimeFailureInAsyncRunExitsWithFailureCode) {
    ProducerClientFactory factory = [](const ProducerConfig&) {
        return std::make_unique<ThreadExhaustedClient>();
    };
    int code = RunBenchmark(config_, factory, out_, err_);

    EXPECT_EQ(code, kExitFailure);
    EXPECT_THAT(err_.str(), StartsWith("ERROR: "));
    EXPECT_THAT(err_.str(), HasSubstr("thread creation failed"));
}

TEST_F(BenchmarkRunnerTest, RuntimeFailureInSyncRunExitsWithFailureCode) {
    config_.mode = RunMode::kSync;
    config_.routines = 4;
    ProducerClientFactory factory = [](const ProducerConfig&) {
        return std::make_unique<ThreadExhaustedClient>();
    };
    int code = RunBenchmark(config_, factory, out_, err_);

    EXPECT_EQ(code, kExitFailure);
    EXPECT_THAT(err_.str(), HasSubstr("thread creation failed"));
}

TEST_F(BenchmarkRunnerTest, FactoryRuntimeFailureExitsWithFailureCode) {
    ProducerClientFactory factory = [](const ProducerConfig&) -> std::unique_ptr<ProducerClient> {
        throw std::bad_alloc();
    };
    EXPECT_EQ(RunBenchmark(config_, factory, out_, err_), kExitFailure);
    EXPECT_THAT(err_.str(), StartsWith("ERROR: "));
}
