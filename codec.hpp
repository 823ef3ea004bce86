#ifndef LANCHAT_CODEC_HPP
#define LANCHAT_CODEC_HPP

#include "chat_common.hpp"

#include <cstddef>
#include <string>

namespace lanchat {

enum class CodecError {
	None,
	TooLarge,
	Malformed,
};

const char *codecErrorName(CodecError err);

// Wire payload: UTF-8 JSON object {"msg": text, "nick": nickname}, at most
// kMaxPayloadBytes. Both fields are trimmed before they are written and after
// they are read; an empty field is malformed in either direction.

// On failure `out` is left untouched and nothing must be sent.
[[nodiscard]] CodecError encodeMessage(const std::string &nickname,const std::string &text,std::string &out);

// Never throws; every kind of garbage comes back as CodecError::Malformed.
[[nodiscard]] CodecError decodeMessage(const char *data,std::size_t len,ChatMessage &out);

[[nodiscard]] inline CodecError decodeMessage(const std::string &payload,ChatMessage &out) {
	return decodeMessage(payload.data(),payload.size(),out);
}

} // namespace lanchat

#endif
