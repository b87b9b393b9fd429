#include "tokvec/text/normalizer.hpp"
#include "tokvec/util/utf8.hpp"

#include <cctype>

namespace tokvec::text {

namespace {

// =============================================================================
// Character classes
// =============================================================================

bool is_space(uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' ||
           cp == '\v' || cp == 0x00A0 || cp == 0x3000 || cp == uint32_t(BOUNDARY);
}

bool is_combining_mark(uint32_t cp) {
    return cp >= 0x0300 && cp <= 0x036F;
}

bool is_punctuation(uint32_t cp) {
    if (cp < 0x80) {
        return std::ispunct(static_cast<int>(cp)) != 0;
    }
    switch (cp) {
        case 0x00A1:  // ¡
        case 0x00AB:  // «
        case 0x00B7:  // ·
        case 0x00BB:  // »
        case 0x00BF:  // ¿
        case 0x2013: case 0x2014:               // dashes
        case 0x2018: case 0x2019: case 0x201C: case 0x201D:  // quotes
        case 0x2026:  // …
        case 0x3001: case 0x3002:               // ideographic comma, full stop
        case 0xFF01: case 0xFF0C: case 0xFF1F:  // fullwidth ! , ?
            return true;
        default:
            return false;
    }
}

uint32_t to_lower(uint32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 32;
    // Latin-1 upper case letters, except the multiplication sign
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) return cp + 32;
    // Latin Extended-A: upper case sits on the even codepoint of each pair,
    // except in the two runs where the pairing shifts by one
    if ((cp >= 0x0100 && cp <= 0x0137 && cp != 0x0130) || (cp >= 0x014A && cp <= 0x0177)) {
        return (cp & 1) == 0 ? cp + 1 : cp;
    }
    if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
        return (cp & 1) == 1 ? cp + 1 : cp;
    }
    // Greek and Cyrillic capitals
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 32;
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 32;
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 80;
    return cp;
}

// Base letter of a precomposed Latin character (0 when it has no diacritic)
uint32_t strip_diacritic(uint32_t cp) {
    static const char* const LATIN1 =
        // 0xC0 - 0xDF
        "AAAAAA\0CEEEEIIII\0NOOOOO\0\0UUUUY\0\0"
        // 0xE0 - 0xFF
        "aaaaaa\0ceeeeiiii\0nooooo\0\0uuuuy\0y";
    if (cp >= 0x00C0 && cp <= 0x00FF) {
        return static_cast<unsigned char>(LATIN1[cp - 0x00C0]);
    }
    switch (cp) {
        case 0x0100: case 0x0102: case 0x0104: return 'A';
        case 0x0101: case 0x0103: case 0x0105: return 'a';
        case 0x0106: case 0x0108: case 0x010A: case 0x010C: return 'C';
        case 0x0107: case 0x0109: case 0x010B: case 0x010D: return 'c';
        case 0x0112: case 0x0114: case 0x0116: case 0x0118: case 0x011A: return 'E';
        case 0x0113: case 0x0115: case 0x0117: case 0x0119: case 0x011B: return 'e';
        case 0x0128: case 0x012A: case 0x012C: case 0x012E: return 'I';
        case 0x0129: case 0x012B: case 0x012D: case 0x012F: return 'i';
        case 0x0143: case 0x0145: case 0x0147: return 'N';
        case 0x0144: case 0x0146: case 0x0148: return 'n';
        case 0x014C: case 0x014E: case 0x0150: return 'O';
        case 0x014D: case 0x014F: case 0x0151: return 'o';
        case 0x015A: case 0x015C: case 0x015E: case 0x0160: return 'S';
        case 0x015B: case 0x015D: case 0x015F: case 0x0161: return 's';
        case 0x0168: case 0x016A: case 0x016C: case 0x016E: case 0x0170: case 0x0172: return 'U';
        case 0x0169: case 0x016B: case 0x016D: case 0x016F: case 0x0171: case 0x0173: return 'u';
        case 0x0179: case 0x017B: case 0x017D: return 'Z';
        case 0x017A: case 0x017C: case 0x017E: return 'z';
        default: return 0;
    }
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool is_url(std::string_view word) {
    return starts_with(word, "http://") || starts_with(word, "https://") ||
           starts_with(word, "www.");
}

} // namespace

// =============================================================================
// TextModelParams
// =============================================================================

TextModelParams TextModelParams::for_language(const std::string& lang) {
    TextModelParams params;
    params.lang = lang;
    if (lang == "ja" || lang == "zh") {
        params.token_list = {1, 2, 3};
    }
    return params;
}

// =============================================================================
// TextNormalizer
// =============================================================================

TextNormalizer::TextNormalizer(TextModelParams params) : params_(std::move(params)) {}

std::string TextNormalizer::normalize_word(std::string_view word) const {
    std::string out;
    out.reserve(word.size());
    for (uint32_t cp : util::decode_utf8(word)) {
        if (params_.del_diac) {
            if (is_combining_mark(cp)) continue;
            if (uint32_t base = strip_diacritic(cp)) cp = base;
        }
        if (params_.del_punc && is_punctuation(cp)) continue;
        if (params_.lc) cp = to_lower(cp);
        out += util::encode_utf8(cp);
    }
    return out;
}

std::string TextNormalizer::normalize(std::string_view text) const {
    std::string result(1, BOUNDARY);
    const std::vector<uint32_t> cps = util::decode_utf8(text);

    size_t i = 0;
    while (i < cps.size()) {
        while (i < cps.size() && is_space(cps[i])) ++i;
        size_t begin = i;
        while (i < cps.size() && !is_space(cps[i])) ++i;
        if (begin == i) break;

        const std::string raw = util::encode_utf8(cps, begin, i);
        if (params_.usr_option == "delete" && raw[0] == '@') continue;
        if (params_.url_option == "delete" && is_url(raw)) continue;

        std::string word = normalize_word(raw);
        if (word.empty()) continue;
        result += word;
        result += BOUNDARY;
    }
    return result;
}

std::vector<std::string> TextNormalizer::split_words(std::string_view normalized) {
    std::vector<std::string> words;
    size_t start = 0;
    while (start <= normalized.size()) {
        size_t pos = normalized.find(BOUNDARY, start);
        if (pos == std::string_view::npos) pos = normalized.size();
        if (pos > start) {
            words.emplace_back(normalized.substr(start, pos - start));
        }
        start = pos + 1;
    }
    return words;
}

std::vector<std::string> TextNormalizer::tokenize(std::string_view text) const {
    const std::vector<std::string> words = split_words(normalize(text));
    std::vector<std::string> tokens;

    for (int n : params_.token_list) {
        if (n < 0) {
            const size_t width = static_cast<size_t>(-n);
            for (size_t i = 0; i + width <= words.size(); ++i) {
                std::string gram = words[i];
                for (size_t j = 1; j < width; ++j) {
                    gram += BOUNDARY;
                    gram += words[i + j];
                }
                tokens.push_back(std::move(gram));
            }
        } else if (n > 0) {
            const size_t q = static_cast<size_t>(n);
            for (const auto& word : words) {
                std::string wrapped = BOUNDARY + word + BOUNDARY;
                std::vector<uint32_t> cps = util::decode_utf8(wrapped);
                for (size_t i = 0; i + q <= cps.size(); ++i) {
                    tokens.push_back(QGRAM_PREFIX + util::encode_utf8(cps, i, i + q));
                }
            }
        }
    }
    return tokens;
}

} // namespace tokvec::text
