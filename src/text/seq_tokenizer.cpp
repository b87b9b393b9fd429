#include "tokvec/text/seq_tokenizer.hpp"
#include "tokvec/util/utf8.hpp"

namespace tokvec::text {

SeqTokenizer::SeqTokenizer(const Vocabulary& vocabulary)
    : normalizer_(vocabulary.params()) {
    for (const auto& token : vocabulary.names()) {
        if (is_qgram(token)) {
            const std::string key = token.substr(2);
            if (surface_.count(key)) continue;
            register_form(key, token);
        } else {
            register_form(BOUNDARY + token + BOUNDARY, token);
        }
    }

    for (const auto& [key, value] : vocabulary.symbols()) {
        register_form(key, value);
        register_form(BOUNDARY + key + BOUNDARY, value);
        register_form(BOUNDARY + key, value);
        register_form(key + BOUNDARY, value);
    }
}

int32_t SeqTokenizer::intern(const std::string& canonical) {
    auto it = label_index_.find(canonical);
    if (it != label_index_.end()) return it->second;
    const int32_t label = static_cast<int32_t>(labels_.size());
    labels_.push_back(canonical);
    label_index_.emplace(canonical, label);
    return label;
}

void SeqTokenizer::register_form(const std::string& surface, const std::string& canonical) {
    if (surface.empty()) return;
    const int32_t label = intern(canonical);
    surface_[surface] = label;
    trie_.insert(util::decode_utf8(surface), label);
}

const std::string* SeqTokenizer::canonical(const std::string& surface) const {
    auto it = surface_.find(surface);
    return it == surface_.end() ? nullptr : &labels_[static_cast<size_t>(it->second)];
}

std::vector<Span> SeqTokenizer::segment(std::string_view normalized) const {
    return trie_.find_spans(util::decode_utf8(normalized));
}

std::vector<std::string> SeqTokenizer::tokenize_normalized(std::string_view normalized) const {
    const std::vector<uint32_t> cps = util::decode_utf8(normalized);
    const std::vector<Span> spans = trie_.find_spans(cps);

    std::vector<std::string> tokens;
    tokens.reserve(spans.size());
    for (const auto& span : spans) {
        if (span.label != CharTrie::NO_LABEL) {
            tokens.push_back(labels_[static_cast<size_t>(span.label)]);
        } else {
            tokens.push_back(util::encode_utf8(cps, span.begin, span.end));
        }
    }
    return tokens;
}

std::vector<std::string> SeqTokenizer::tokenize(std::string_view text) const {
    return tokenize_normalized(normalizer_.normalize(text));
}

} // namespace tokvec::text
