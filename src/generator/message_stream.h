#ifndef PRODUCER_PERF_MESSAGE_STREAM_H_
#define PRODUCER_PERF_MESSAGE_STREAM_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <thread>

#include "folly/MPMCQueue.h"

#include "outbound_message.h"

namespace ProducerPerf {

// Upper bound on buffered messages per stream
constexpr size_t kMaxStreamCapacity = 65536;

/**
 * Channel capacity for a run of message_load messages:
 * min(message_load / 4, 65536), and at least one slot.
 */
size_t StreamCapacity(int64_t message_load);

/**
 * Bounded, closable single-writer channel of OutboundMessages.
 *
 * The writer body runs on a thread owned by the stream and hands messages
 * to an emit function, which blocks while the buffer is full. When the body
 * returns the stream is closed; if it throws, the exception is rethrown
 * from Next() once the reader reaches the end of the stream.
 * Destroying an undrained stream cancels the writer.
 * @threading One writer thread, one reader.
 */
class MessageStream {
public:
	// Returns false once the stream has been cancelled; the body should stop.
	using EmitFunc = std::function<bool(OutboundMessage&&)>;
	using WriterBody = std::function<void(const EmitFunc& emit)>;

	MessageStream(size_t capacity, WriterBody body);
	~MessageStream();

	MessageStream(const MessageStream&) = delete;
	MessageStream& operator=(const MessageStream&) = delete;

	/**
	 * Blocks until the next message is available.
	 * @return std::nullopt once the stream is closed and drained
	 * @throws whatever the writer body threw, after the last message
	 */
	std::optional<OutboundMessage> Next();

	size_t capacity() const { return capacity_; }

private:
	void WriterThread(WriterBody body);
	bool Emit(OutboundMessage&& message);

	const size_t capacity_;
	folly::MPMCQueue<std::optional<OutboundMessage>> queue_;
	std::atomic<bool> cancelled_{false};
	std::exception_ptr error_;
	bool closed_ = false;
	std::thread writer_;
};

} // namespace ProducerPerf

#endif // PRODUCER_PERF_MESSAGE_STREAM_H_
