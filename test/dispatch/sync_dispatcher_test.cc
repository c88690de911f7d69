#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/dispatch/sync_dispatcher.h"
#include "../../src/common/errors.h"
#include "../client/fake_producer_client.h"

#include <chrono>
#include <map>
#include <system_error>

using namespace ProducerPerf;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class SyncDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.mode = RunMode::kSync;
        config_.message_load = 10;
        config_.message_size = 8;
        config_.topic = "bench";
        config_.routines = 3;
        generator_ = std::make_unique<RandomMessageGenerator>(config_.message_size);
    }

    BenchmarkConfig config_;
    std::unique_ptr<MessageGenerator> generator_;
};

TEST_F(SyncDispatcherTest, WorkersShareTheLoad) {
    FakeProducerClient client;
    SyncDispatcher dispatcher(config_, client, *generator_);

    DispatchResult result = dispatcher.Run();

    EXPECT_EQ(result.sent, 10);
    EXPECT_EQ(result.acknowledged, 10);
    EXPECT_EQ(client.sends(), 10);
    // Sync sends never go through the completion queue
    EXPECT_EQ(client.awaited(), 0);
}

TEST_F(SyncDispatcherTest, SingleRoutineSendsEveryMessageOnce) {
    config_.routines = 1;
    FakeProducerClient client;
    SyncDispatcher dispatcher(config_, client, *generator_);

    dispatcher.Run();

    std::map<std::string, int> seen;
    for (const auto& payload : client.payloads()) {
        seen[payload]++;
    }
    EXPECT_EQ(seen.size(), 10u);
}

TEST_F(SyncDispatcherTest, PacedWorkerRepeatsEachMessage) {
    config_.routines = 1;
    config_.message_load = 2;
    config_.throughput = 3;
    FakeProducerClient client;
    SyncDispatcher dispatcher(config_, client, *generator_, 10ms);

    DispatchResult result = dispatcher.Run();

    // Each drawn message goes out throughput times before the window wait.
    EXPECT_EQ(result.sent, 6);
    std::vector<std::string> payloads = client.payloads();
    ASSERT_EQ(payloads.size(), 6u);
    EXPECT_EQ(payloads[0], payloads[1]);
    EXPECT_EQ(payloads[1], payloads[2]);
    EXPECT_EQ(payloads[3], payloads[4]);
    EXPECT_EQ(payloads[4], payloads[5]);
    EXPECT_NE(payloads[0], payloads[3]);
}

TEST_F(SyncDispatcherTest, FirstFailureStopsAllWorkers) {
    config_.message_load = 100000;
    config_.routines = 4;
    FakeProducerClient client(/*fail_at=*/5);
    SyncDispatcher dispatcher(config_, client, *generator_);

    try {
        dispatcher.Run();
        FAIL() << "expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_STREQ(e.what(), "Failed to send message: Broker: Not enough in-sync replicas");
    }
    EXPECT_LT(client.sends(), 100000);
}

TEST_F(SyncDispatcherTest, MockedClientSeesEveryMessage) {
    config_.routines = 2;
    MockProducerClient client;
    EXPECT_CALL(client, SendSync(_)).Times(10).WillRepeatedly(Return(DeliveryReport{1, 7, ""}));
    EXPECT_CALL(client, SendAsync(_)).Times(0);

    SyncDispatcher dispatcher(config_, client, *generator_);
    EXPECT_EQ(dispatcher.Run().acknowledged, 10);
}

TEST_F(SyncDispatcherTest, TooManyRoutinesIsConfigurationError) {
    config_.routines = 11;
    FakeProducerClient client;
    SyncDispatcher dispatcher(config_, client, *generator_);
    EXPECT_THROW(dispatcher.Run(), ConfigurationError);
}

TEST_F(SyncDispatcherTest, RuntimeFailureIsRethrownAfterWorkersJoin) {
    config_.routines = 2;
    MockProducerClient client;
    EXPECT_CALL(client, SendSync(_))
        .WillRepeatedly(Throw(std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                                "thread creation failed")));

    SyncDispatcher dispatcher(config_, client, *generator_);
    EXPECT_THROW(dispatcher.Run(), std::system_error);
}
