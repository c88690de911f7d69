#ifndef PRODUCER_PERF_OUTBOUND_MESSAGE_H_
#define PRODUCER_PERF_OUTBOUND_MESSAGE_H_

#include <cstdint>
#include <memory>
#include <string>

namespace ProducerPerf {

using Payload = std::string;

// -1 lets the producer client choose the partition
constexpr int32_t kAnyPartition = -1;

/**
 * One message to produce. Payloads are shared and never mutated, so
 * file-backed messages point into the record pool instead of copying.
 */
struct OutboundMessage {
    std::string topic;
    int32_t partition = kAnyPartition;
    std::shared_ptr<const Payload> payload;

    size_t size() const { return payload ? payload->size() : 0; }
};

/**
 * How many messages a single generator instance emits, and where to.
 */
struct GenerationJob {
    std::string topic;
    int32_t partition = kAnyPartition;
    int64_t count = 0;
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_OUTBOUND_MESSAGE_H_
