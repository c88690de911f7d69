#include "payload_decoder.h"

#include <unordered_map>

#include <glog/logging.h>
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"

#include "../common/errors.h"

namespace ProducerPerf {

std::string DecodeRaw(absl::string_view text) {
	return std::string(text);
}

std::string DecodeHex(absl::string_view text) {
	if (text.size() % 2 != 0) {
		throw DecodeError(absl::StrCat("odd length hex string: ", text.size(), " characters"));
	}
	for (size_t i = 0; i < text.size(); ++i) {
		if (!absl::ascii_isxdigit(static_cast<unsigned char>(text[i]))) {
			throw DecodeError(absl::StrCat("invalid hex character at offset ", i));
		}
	}
	return absl::HexStringToBytes(text);
}

std::string DecodeBase64(absl::string_view text) {
	// Standard encoding is always padded to a multiple of four characters.
	if (text.size() % 4 != 0) {
		throw DecodeError(absl::StrCat("illegal base64 data: length ", text.size(),
					" is not a multiple of 4"));
	}
	// Base64Unescape skips whitespace; the standard encoding does not.
	for (size_t i = 0; i < text.size(); ++i) {
		unsigned char c = static_cast<unsigned char>(text[i]);
		if (!absl::ascii_isalnum(c) && c != '+' && c != '/' && c != '=') {
			throw DecodeError(absl::StrCat("illegal base64 data at input byte ", i));
		}
	}
	std::string decoded;
	if (!absl::Base64Unescape(text, &decoded)) {
		throw DecodeError("illegal base64 data");
	}
	return decoded;
}

DecoderFunc ParseMessageDecoder(const std::string& scheme) {
	static const std::unordered_map<std::string, DecoderFunc> decoders = {
		{"raw", DecodeRaw},
		{"hex", DecodeHex},
		{"base64", DecodeBase64}
	};

	auto it = decoders.find(scheme);
	if (it != decoders.end()) {
		VLOG(1) << "Using message decoder " << scheme;
		return it->second;
	}

	LOG(ERROR) << "Invalid message decoder: " << scheme;
	throw ConfigurationError("Unknown -message-decoder: " + scheme);
}

} // namespace ProducerPerf
