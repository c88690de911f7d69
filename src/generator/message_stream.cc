#include "message_stream.h"

#include <algorithm>
#include <chrono>

#include <glog/logging.h>

namespace ProducerPerf {

namespace {
// How often a blocked writer re-checks for cancellation
constexpr std::chrono::milliseconds kCancelPollInterval{50};
}

size_t StreamCapacity(int64_t message_load) {
	if (message_load <= 0) return 1;
	size_t size = std::min(static_cast<size_t>(message_load / 4), kMaxStreamCapacity);
	return std::max<size_t>(size, 1);
}

MessageStream::MessageStream(size_t capacity, WriterBody body)
	: capacity_(std::max<size_t>(capacity, 1)),
	  queue_(capacity_) {
	writer_ = std::thread(&MessageStream::WriterThread, this, std::move(body));
}

MessageStream::~MessageStream() {
	cancelled_.store(true, std::memory_order_release);
	if (writer_.joinable()) {
		writer_.join();
	}
}

bool MessageStream::Emit(OutboundMessage&& message) {
	std::optional<OutboundMessage> item(std::move(message));
	while (!queue_.tryWriteUntil(std::chrono::steady_clock::now() + kCancelPollInterval, std::move(item))) {
		if (cancelled_.load(std::memory_order_acquire)) {
			return false;
		}
	}
	return true;
}

void MessageStream::WriterThread(WriterBody body) {
	EmitFunc emit = [this](OutboundMessage&& message) { return Emit(std::move(message)); };
	try {
		body(emit);
	} catch (const std::exception& e) {
		LOG(ERROR) << "Message generation failed: " << e.what();
		error_ = std::current_exception();
	}

	// Close: a sentinel value tells the reader no more messages follow.
	std::optional<OutboundMessage> sentinel = std::nullopt;
	while (!queue_.tryWriteUntil(std::chrono::steady_clock::now() + kCancelPollInterval, std::move(sentinel))) {
		if (cancelled_.load(std::memory_order_acquire)) {
			return;
		}
	}
}

std::optional<OutboundMessage> MessageStream::Next() {
	if (closed_) {
		return std::nullopt;
	}
	std::optional<OutboundMessage> item;
	queue_.blockingRead(item);
	if (!item.has_value()) {
		closed_ = true;
		if (error_) {
			std::rethrow_exception(error_);
		}
	}
	return item;
}

} // namespace ProducerPerf
