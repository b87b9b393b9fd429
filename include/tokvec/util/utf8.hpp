#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tokvec::util {

// Decode UTF-8 bytes to Unicode codepoints (invalid sequences become U+FFFD)
std::vector<uint32_t> decode_utf8(std::string_view data);

// Encode codepoint to UTF-8 bytes
std::string encode_utf8(uint32_t codepoint);

// Encode codepoints [begin, end) of a decoded string back to UTF-8
std::string encode_utf8(const std::vector<uint32_t>& codepoints, size_t begin, size_t end);

// Number of codepoints in a UTF-8 string
size_t utf8_length(std::string_view data);

} // namespace tokvec::util
