#include "message_generator.h"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <glog/logging.h>
#include <openssl/rand.h>
#include "absl/strings/str_cat.h"

#include "../common/config.h"
#include "../common/errors.h"

namespace ProducerPerf {

namespace {

bool OpenSSLRandomSource(unsigned char* buf, size_t len) {
	if (len == 0) return true;
	return RAND_bytes(buf, static_cast<int>(len)) == 1;
}

} // namespace

//----------------------------------------------------------------------------
// RandomMessageGenerator
//----------------------------------------------------------------------------

RandomMessageGenerator::RandomMessageGenerator(size_t message_size)
	: RandomMessageGenerator(message_size, OpenSSLRandomSource) {}

RandomMessageGenerator::RandomMessageGenerator(size_t message_size, RandomSource source)
	: message_size_(message_size), source_(std::move(source)) {}

std::unique_ptr<MessageStream> RandomMessageGenerator::Generate(const GenerationJob& job) {
	LOG(INFO) << "RandomMessageGenerator is generating " << job.count << " messages";

	size_t message_size = message_size_;
	RandomSource source = source_;
	return std::make_unique<MessageStream>(StreamCapacity(job.count),
			[job, message_size, source](const MessageStream::EmitFunc& emit) {
		for (int64_t i = 0; i < job.count; i++) {
			auto payload = std::make_shared<Payload>(message_size, '\0');
			if (!source(reinterpret_cast<unsigned char*>(&(*payload)[0]), payload->size())) {
				throw GenerationError("Failed to generate message payload: random source failed");
			}
			OutboundMessage message{job.topic, job.partition, std::move(payload)};
			if (!emit(std::move(message))) {
				VLOG(1) << "RandomMessageGenerator cancelled after " << i << " messages";
				return;
			}
		}
	});
}

//----------------------------------------------------------------------------
// FileMessageGenerator
//----------------------------------------------------------------------------

FileMessageGenerator::FileMessageGenerator(const std::string& message_file, DecoderFunc decoder)
	: message_file_(message_file) {
	std::ifstream in(message_file_);
	if (!in.is_open()) {
		throw ConfigurationError(absl::StrCat("Failed to open message file: ", message_file_,
					": ", std::strerror(errno)));
	}

	records_.reserve(64);
	std::string line;
	while (std::getline(in, line)) {
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (line.empty()) {
			continue;
		}
		try {
			records_.push_back(std::make_shared<const Payload>(decoder(line)));
		} catch (const DecodeError& e) {
			throw DecodeError(absl::StrCat("Failed to decode message data on line ",
						records_.size() + 1, " of ", message_file_, ": ", e.what()));
		}
	}
	if (in.bad()) {
		throw ConfigurationError(absl::StrCat("Failed to scan message file: ", message_file_));
	}
	if (records_.empty()) {
		throw ConfigurationError(absl::StrCat("Message file has no records: ", message_file_));
	}
	VLOG(1) << "Loaded " << records_.size() << " records from " << message_file_;
}

std::unique_ptr<MessageStream> FileMessageGenerator::Generate(const GenerationJob& job) {
	LOG(INFO) << "FileMessageGenerator is generating " << job.count << " messages from "
		<< records_.size() << " records";

	// The pool is read-only from here on; streams share it.
	auto records = records_;
	return std::make_unique<MessageStream>(StreamCapacity(job.count),
			[job, records](const MessageStream::EmitFunc& emit) {
		for (int64_t i = 0; i < job.count; i++) {
			OutboundMessage message{job.topic, job.partition, records[i % records.size()]};
			if (!emit(std::move(message))) {
				return;
			}
		}
	});
}

std::unique_ptr<MessageGenerator> MakeMessageGenerator(const BenchmarkConfig& config) {
	if (config.message_file.empty()) {
		return std::make_unique<RandomMessageGenerator>(config.message_size);
	}
	// Resolve the decoder first so an unknown scheme fails before any file I/O.
	DecoderFunc decoder = ParseMessageDecoder(config.message_decoder);
	return std::make_unique<FileMessageGenerator>(config.message_file, std::move(decoder));
}

} // namespace ProducerPerf
