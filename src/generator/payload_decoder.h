#ifndef PRODUCER_PERF_PAYLOAD_DECODER_H_
#define PRODUCER_PERF_PAYLOAD_DECODER_H_

#include <functional>
#include <string>

#include "absl/strings/string_view.h"

namespace ProducerPerf {

/**
 * Turns one line of the message file into a payload.
 * @throws DecodeError if the line is not valid for the scheme
 */
using DecoderFunc = std::function<std::string(absl::string_view text)>;

/**
 * Returns the decoder for "raw", "hex" or "base64".
 * @throws ConfigurationError for any other scheme name
 */
DecoderFunc ParseMessageDecoder(const std::string& scheme);

std::string DecodeRaw(absl::string_view text);
std::string DecodeHex(absl::string_view text);
std::string DecodeBase64(absl::string_view text);

} // namespace ProducerPerf

#endif // PRODUCER_PERF_PAYLOAD_DECODER_H_
