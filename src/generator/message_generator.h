#ifndef PRODUCER_PERF_MESSAGE_GENERATOR_H_
#define PRODUCER_PERF_MESSAGE_GENERATOR_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "message_stream.h"
#include "outbound_message.h"
#include "payload_decoder.h"

namespace ProducerPerf {

struct BenchmarkConfig;

/**
 * Produces the messages of one benchmark run (or one synchronous worker's
 * share of it). Each Generate() call starts an independent stream that
 * emits exactly job.count messages and then closes.
 */
class MessageGenerator {
public:
	virtual ~MessageGenerator() = default;

	virtual std::unique_ptr<MessageStream> Generate(const GenerationJob& job) = 0;
};

/**
 * Fills every payload with message_size cryptographically strong random
 * bytes. A failing random source ends the stream with a GenerationError.
 */
class RandomMessageGenerator : public MessageGenerator {
public:
	// Fills the buffer; returns false if no random bytes could be produced.
	using RandomSource = std::function<bool(unsigned char* buf, size_t len)>;

	explicit RandomMessageGenerator(size_t message_size);
	RandomMessageGenerator(size_t message_size, RandomSource source);

	std::unique_ptr<MessageStream> Generate(const GenerationJob& job) override;

	size_t message_size() const { return message_size_; }

private:
	size_t message_size_;
	RandomSource source_;
};

/**
 * Cycles through the decoded non-empty lines of a message file.
 * The whole record pool is loaded and decoded by the constructor.
 */
class FileMessageGenerator : public MessageGenerator {
public:
	/**
	 * @throws ConfigurationError if the file cannot be read or has no records
	 * @throws DecodeError if any line fails to decode
	 */
	FileMessageGenerator(const std::string& message_file, DecoderFunc decoder);

	std::unique_ptr<MessageStream> Generate(const GenerationJob& job) override;

	const std::vector<std::shared_ptr<const Payload>>& records() const { return records_; }

private:
	std::string message_file_;
	std::vector<std::shared_ptr<const Payload>> records_;
};

/**
 * Random generator when no message file is configured, file generator
 * otherwise. Unknown decoder names fail before the file is opened.
 */
std::unique_ptr<MessageGenerator> MakeMessageGenerator(const BenchmarkConfig& config);

} // namespace ProducerPerf

#endif // PRODUCER_PERF_MESSAGE_GENERATOR_H_
