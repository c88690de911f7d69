#include <gtest/gtest.h>
#include "../../src/generator/message_stream.h"
#include "../../src/common/errors.h"

#include <atomic>
#include <chrono>
#include <thread>

using namespace ProducerPerf;
using namespace std::chrono_literals;

namespace {

OutboundMessage MakeMessage(const std::string& text) {
    return OutboundMessage{"topic", kAnyPartition, std::make_shared<const Payload>(text)};
}

} // namespace

TEST(StreamCapacityTest, QuarterOfLoadWithinBounds) {
    EXPECT_EQ(StreamCapacity(100), 25u);
    EXPECT_EQ(StreamCapacity(3), 1u);
    EXPECT_EQ(StreamCapacity(1), 1u);
    EXPECT_EQ(StreamCapacity(4 * 65536), kMaxStreamCapacity);
    EXPECT_EQ(StreamCapacity(100000000), kMaxStreamCapacity);
}

TEST(MessageStreamTest, DeliversInOrderThenCloses) {
    MessageStream stream(2, [](const MessageStream::EmitFunc& emit) {
        for (int i = 0; i < 10; i++) {
            ASSERT_TRUE(emit(MakeMessage(std::to_string(i))));
        }
    });

    for (int i = 0; i < 10; i++) {
        auto message = stream.Next();
        ASSERT_TRUE(message.has_value());
        EXPECT_EQ(*message->payload, std::to_string(i));
        EXPECT_EQ(message->topic, "topic");
    }
    EXPECT_FALSE(stream.Next().has_value());
    // Stays closed
    EXPECT_FALSE(stream.Next().has_value());
}

TEST(MessageStreamTest, WriterErrorSurfacesAfterLastMessage) {
    MessageStream stream(4, [](const MessageStream::EmitFunc& emit) {
        emit(MakeMessage("first"));
        throw GenerationError("Failed to generate message payload: boom");
    });

    auto message = stream.Next();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(*message->payload, "first");
    EXPECT_THROW(stream.Next(), GenerationError);
    EXPECT_FALSE(stream.Next().has_value());
}

TEST(MessageStreamTest, DestroyingUndrainedStreamStopsWriter) {
    std::atomic<int> emitted{0};
    std::atomic<bool> cancelled{false};
    {
        MessageStream stream(1, [&](const MessageStream::EmitFunc& emit) {
            for (int i = 0; i < 1000; i++) {
                if (!emit(MakeMessage("x"))) {
                    cancelled = true;
                    return;
                }
                emitted++;
            }
        });
        ASSERT_TRUE(stream.Next().has_value());
    }
    EXPECT_TRUE(cancelled);
    EXPECT_LT(emitted.load(), 1000);
}

TEST(MessageStreamTest, ReaderBlocksUntilWriterEmits) {
    MessageStream stream(1, [](const MessageStream::EmitFunc& emit) {
        std::this_thread::sleep_for(50ms);
        emit(MakeMessage("late"));
    });

    auto start = std::chrono::steady_clock::now();
    auto message = stream.Next();
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(*message->payload, "late");
    EXPECT_GE(elapsed, 40ms);
    EXPECT_FALSE(stream.Next().has_value());
}
