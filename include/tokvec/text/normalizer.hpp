/**
 * Base text model: normalization and candidate-token generation.
 *
 * normalize() turns an utterance into the marker-joined form
 * "~w1~w2~...~wn~" that every tokenizer in the library segments.
 * tokenize() produces the raw candidates (word n-grams and "q:"-prefixed
 * character q-grams) from which a vocabulary is selected.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tokvec::text {

// Word boundary marker
constexpr char BOUNDARY = '~';
constexpr const char* QGRAM_PREFIX = "q:";

inline bool is_qgram(std::string_view token) {
    return token.size() >= 2 && token[0] == 'q' && token[1] == ':';
}

/**
 * Persisted as the "params" record of a vocabulary.
 */
struct TextModelParams {
    std::string lang = "es";
    bool lc = true;                         // Lower-case
    bool del_diac = true;                   // Strip diacritics
    bool del_punc = true;                   // Drop punctuation
    std::string usr_option = "delete";      // "delete" drops @user words
    std::string url_option = "delete";      // "delete" drops URLs
    // n < 0: word |n|-grams; q > 0: character q-grams over each "~word~"
    std::vector<int> token_list = {-1, 2, 3, 4, 5, 6, 7, 8};

    // Defaults for a language; ja and zh use character q-grams only
    static TextModelParams for_language(const std::string& lang);
};

/**
 * Candidate tokenizer consumed by the vocabulary builder.
 */
class BaseTokenizer {
public:
    virtual ~BaseTokenizer() = default;

    virtual std::string normalize(std::string_view text) const = 0;
    virtual std::vector<std::string> tokenize(std::string_view text) const = 0;
};

class TextNormalizer : public BaseTokenizer {
public:
    explicit TextNormalizer(TextModelParams params);

    std::string normalize(std::string_view text) const override;
    std::vector<std::string> tokenize(std::string_view text) const override;

    // Words of an already normalized text
    static std::vector<std::string> split_words(std::string_view normalized);

    const TextModelParams& params() const { return params_; }

private:
    std::string normalize_word(std::string_view word) const;

    TextModelParams params_;
};

} // namespace tokvec::text
