#ifndef PRODUCER_PERF_PRODUCER_CLIENT_H_
#define PRODUCER_PERF_PRODUCER_CLIENT_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "../generator/outbound_message.h"
#include "../metrics/metrics_registry.h"

namespace ProducerPerf {

/**
 * Outcome of one produced message. An empty error means it was delivered.
 */
struct DeliveryReport {
    int32_t partition = -1;
    int64_t offset = -1;
    std::string error;

    bool ok() const { return error.empty(); }
};

/**
 * The narrow produce API the benchmark drives. Implementations must be
 * safe for concurrent use by several senders and a metrics reader.
 */
class ProducerClient {
public:
    virtual ~ProducerClient() = default;

    /**
     * Hands a message to the client without waiting for delivery. Blocks
     * while the client's own buffers are full. Every call is matched by
     * exactly one report from AwaitCompletion().
     */
    virtual void SendAsync(const OutboundMessage& message) = 0;

    /**
     * Waits up to timeout for the next asynchronous delivery report.
     * @return std::nullopt if none arrived in time
     */
    virtual std::optional<DeliveryReport> AwaitCompletion(std::chrono::milliseconds timeout) = 0;

    // Produces one message and waits for its delivery report.
    virtual DeliveryReport SendSync(const OutboundMessage& message) = 0;

    /**
     * Flushes outstanding messages and releases the client.
     * @return false with errstr set if messages could not be flushed
     */
    virtual bool Close(std::string& errstr) = 0;

    virtual const MetricsRegistry& Metrics() const = 0;
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_PRODUCER_CLIENT_H_
