#include "tokvec/util/utf8.hpp"

namespace tokvec::util {

// Invalid sequences are replaced with U+FFFD; a leading BOM is skipped
std::vector<uint32_t> decode_utf8(std::string_view data) {
    std::vector<uint32_t> codepoints;
    codepoints.reserve(data.size());

    const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* end = p + data.size();

    if (data.size() >= 3 && p[0] == 0xEF && p[1] == 0xBB && p[2] == 0xBF) {
        p += 3;
    }

    while (p < end) {
        uint32_t cp;

        if (*p < 0x80) {
            // ASCII fast path
            cp = *p++;
        } else if ((*p & 0xE0) == 0xC0 && p + 1 < end) {
            uint8_t b1 = *p++;
            uint8_t b2 = *p++;
            if ((b2 & 0xC0) != 0x80) {
                cp = 0xFFFD;
                p--;
            } else {
                cp = ((b1 & 0x1F) << 6) | (b2 & 0x3F);
                if (cp < 0x80) cp = 0xFFFD;  // Overlong
            }
        } else if ((*p & 0xF0) == 0xE0 && p + 2 < end) {
            uint8_t b1 = *p++;
            uint8_t b2 = *p++;
            uint8_t b3 = *p++;
            if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80) {
                cp = 0xFFFD;
                p -= 2;
            } else {
                cp = ((b1 & 0x0F) << 12) | ((b2 & 0x3F) << 6) | (b3 & 0x3F);
                if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
            }
        } else if ((*p & 0xF8) == 0xF0 && p + 3 < end) {
            uint8_t b1 = *p++;
            uint8_t b2 = *p++;
            uint8_t b3 = *p++;
            uint8_t b4 = *p++;
            if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80 || (b4 & 0xC0) != 0x80) {
                cp = 0xFFFD;
                p -= 3;
            } else {
                cp = ((b1 & 0x07) << 18) | ((b2 & 0x3F) << 12) | ((b3 & 0x3F) << 6) | (b4 & 0x3F);
                if (cp < 0x10000 || cp > 0x10FFFF) cp = 0xFFFD;
            }
        } else {
            cp = 0xFFFD;
            ++p;
        }

        codepoints.push_back(cp);
    }

    return codepoints;
}

std::string encode_utf8(uint32_t cp) {
    std::string result;
    if (cp < 0x80) {
        result.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return result;
}

std::string encode_utf8(const std::vector<uint32_t>& codepoints, size_t begin, size_t end) {
    std::string result;
    result.reserve(end - begin);
    for (size_t i = begin; i < end && i < codepoints.size(); ++i) {
        result += encode_utf8(codepoints[i]);
    }
    return result;
}

size_t utf8_length(std::string_view data) {
    size_t count = 0;
    for (unsigned char c : data) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

} // namespace tokvec::util
