/**
 * Vocabulary Builder
 *
 * Selects a 2^k sub-word vocabulary from the candidates of the base text
 * model. Starting from the 2^k most frequent words, each q-gram length
 * (longest first) is offered to a temporary tokenizer; every distinct word
 * is re-segmented and credits its frequency to the tokens it produces, and
 * the 2^k best credited tokens carry over to the next length. A final pass
 * re-tokenizes the whole corpus to obtain true record frequencies.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "tokvec/text/counter.hpp"
#include "tokvec/text/normalizer.hpp"
#include "tokvec/text/vocabulary.hpp"
#include "tokvec/thread_pool.hpp"

namespace tokvec::build {

// Admissibility of a "q:"-prefixed q-gram of the given length
using QgramFilter = std::function<bool(const std::string& qgram, int length)>;

// Below length 4 only q-grams touching a word boundary are admitted
QgramFilter prefix_suffix_filter();
QgramFilter admit_all_filter();

struct VocabularyBuildOptions {
    std::string lang = "es";
    int size_exponent = 13;
    bool prefix_suffix = true;
    size_t limit = 0;               // Records read from the corpus, 0 = all
    std::string symbols_file;       // Optional JSON object of symbol aliases

    size_t budget() const { return size_t(1) << size_exponent; }

    static VocabularyBuildOptions from_config();
};

/**
 * Base candidates split into whole words and q-grams by length.
 */
struct BaseVocabulary {
    text::Counter words;
    std::map<int, text::Counter, std::greater<int>> qgrams;
    uint64_t update_calls = 0;

    // Base frequency of a word or q-gram token
    int64_t frequency(const std::string& token) const;
};

// Counts the de-duplicated candidates of every record
text::Counter compute_base_vocabulary(const std::vector<std::string>& texts,
                                      const text::BaseTokenizer& tokenizer,
                                      ThreadPool& pool = ThreadPool::instance());

BaseVocabulary split_base_vocabulary(const text::Counter& counter);

// De-duplicated tokens in first-occurrence order
std::vector<std::string> unique_tokens(const std::vector<std::string>& tokens);

class VocabularyBuilder {
public:
    explicit VocabularyBuilder(VocabularyBuildOptions options,
                               QgramFilter filter = {},
                               ThreadPool& pool = ThreadPool::instance());

    /**
     * Iterative refinement over q-gram lengths.
     * Returns the 2^k best tokens with their accumulated word credit.
     */
    std::vector<text::Counter::Entry> refine(const BaseVocabulary& base,
                                             const text::TextModelParams& params) const;

    // refine() followed by the corpus-wide recount
    text::Vocabulary build(const BaseVocabulary& base,
                           const text::TextModelParams& params,
                           const std::vector<std::string>& corpus) const;

    // Whole pipeline from raw texts
    text::Vocabulary build(const std::vector<std::string>& corpus) const;

    const VocabularyBuildOptions& options() const { return options_; }

private:
    size_t corpus_size(const std::vector<std::string>& corpus) const;

    VocabularyBuildOptions options_;
    QgramFilter filter_;
    ThreadPool& pool_;
    text::SymbolTable symbols_;
};

} // namespace tokvec::build
