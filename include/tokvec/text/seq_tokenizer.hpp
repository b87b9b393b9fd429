#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tokvec/text/normalizer.hpp"
#include "tokvec/text/trie.hpp"
#include "tokvec/text/vocabulary.hpp"

namespace tokvec::text {

/**
 * Segments normalized text into vocabulary tokens by longest match.
 *
 * Surface forms registered per token:
 *   "q:xyz"  -> "xyz"        (skipped when "xyz" is already registered)
 *   "word"   -> "~word~"     (replaces any earlier registration)
 *   symbol k -> k, "~k~", "~k", "k~"
 *
 * Built once from a vocabulary snapshot and read-only afterwards; one
 * instance may be shared by concurrent callers.
 */
class SeqTokenizer {
public:
    explicit SeqTokenizer(const Vocabulary& vocabulary);

    // Spans over the codepoints of an already normalized text
    std::vector<Span> segment(std::string_view normalized) const;

    // normalize() followed by segmentation and canonicalization
    std::vector<std::string> tokenize(std::string_view text) const;
    std::vector<std::string> tokenize_normalized(std::string_view normalized) const;

    // Canonical token of a surface form, if registered
    const std::string* canonical(const std::string& surface) const;

    const TextNormalizer& normalizer() const { return normalizer_; }
    size_t surface_forms() const { return surface_.size(); }

private:
    void register_form(const std::string& surface, const std::string& canonical);
    int32_t intern(const std::string& canonical);

    TextNormalizer normalizer_;
    CharTrie trie_;
    std::vector<std::string> labels_;
    std::unordered_map<std::string, int32_t> label_index_;
    std::unordered_map<std::string, int32_t> surface_;
};

} // namespace tokvec::text
