#include "tokvec/build/vocabulary_builder.hpp"
#include "tokvec/config.hpp"
#include "tokvec/error.hpp"
#include "tokvec/io/artifact_io.hpp"
#include "tokvec/logging.hpp"
#include "tokvec/text/seq_tokenizer.hpp"
#include "tokvec/util/utf8.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_set>

namespace tokvec::build {

// =============================================================================
// Filters and options
// =============================================================================

QgramFilter prefix_suffix_filter() {
    return [](const std::string& qgram, int length) {
        if (length >= 4) return true;
        const std::string_view body = std::string_view(qgram).substr(2);
        return !body.empty() && (body.front() == text::BOUNDARY || body.back() == text::BOUNDARY);
    };
}

QgramFilter admit_all_filter() {
    return [](const std::string&, int) { return true; };
}

VocabularyBuildOptions VocabularyBuildOptions::from_config() {
    const Config& config = Config::getInstance();
    VocabularyBuildOptions options;
    options.lang = config.get<std::string>("voc.lang", options.lang);
    options.size_exponent = config.get<int>("voc.size_exponent", options.size_exponent);
    options.prefix_suffix = config.get<bool>("voc.prefix_suffix", options.prefix_suffix);
    options.limit = config.get<size_t>("voc.limit", options.limit);
    options.symbols_file = config.get<std::string>("voc.symbols", options.symbols_file);
    return options;
}

// =============================================================================
// Base vocabulary
// =============================================================================

int64_t BaseVocabulary::frequency(const std::string& token) const {
    if (!text::is_qgram(token)) {
        return words.get(token);
    }
    const int length = static_cast<int>(util::utf8_length(std::string_view(token).substr(2)));
    auto it = qgrams.find(length);
    return it == qgrams.end() ? 0 : it->second.get(token);
}

std::vector<std::string> unique_tokens(const std::vector<std::string>& tokens) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    result.reserve(tokens.size());
    for (const auto& token : tokens) {
        if (seen.insert(token).second) {
            result.push_back(token);
        }
    }
    return result;
}

text::Counter compute_base_vocabulary(const std::vector<std::string>& texts,
                                      const text::BaseTokenizer& tokenizer,
                                      ThreadPool& pool) {
    auto sets = pool.parallel_map(texts.size(), [&](size_t i) {
        return unique_tokens(tokenizer.tokenize(texts[i]));
    });

    text::Counter counter;
    for (const auto& tokens : sets) {
        counter.update(tokens);
    }
    LOG_INFO("Base vocabulary: ", counter.size(), " candidates from ",
             counter.update_calls(), " records");
    return counter;
}

BaseVocabulary split_base_vocabulary(const text::Counter& counter) {
    BaseVocabulary base;
    base.update_calls = counter.update_calls();
    for (const auto& [token, count] : counter.items()) {
        if (text::is_qgram(token)) {
            const int length = static_cast<int>(util::utf8_length(std::string_view(token).substr(2)));
            base.qgrams[length].add(token, count);
        } else {
            base.words.add(token, count);
        }
    }
    for (auto& [length, qgrams] : base.qgrams) {
        qgrams.set_update_calls(base.update_calls);
    }
    base.words.set_update_calls(base.update_calls);
    return base;
}

// =============================================================================
// VocabularyBuilder
// =============================================================================

VocabularyBuilder::VocabularyBuilder(VocabularyBuildOptions options, QgramFilter filter,
                                     ThreadPool& pool)
    : options_(std::move(options))
    , filter_(std::move(filter))
    , pool_(pool) {
    TOKVEC_CHECK_ARGUMENT(options_.size_exponent > 0 && options_.size_exponent <= 30,
                          "size_exponent must be in [1, 30]");
    if (!filter_) {
        filter_ = options_.prefix_suffix ? prefix_suffix_filter() : admit_all_filter();
    }
    if (!options_.symbols_file.empty()) {
        symbols_ = io::load_symbols(options_.symbols_file);
    }
}

size_t VocabularyBuilder::corpus_size(const std::vector<std::string>& corpus) const {
    return options_.limit > 0 ? std::min(options_.limit, corpus.size()) : corpus.size();
}

std::vector<text::Counter::Entry> VocabularyBuilder::refine(const BaseVocabulary& base,
                                                            const text::TextModelParams& params) const {
    const size_t budget = options_.budget();
    const std::string marker(1, text::BOUNDARY);

    std::vector<std::string> words;
    words.reserve(base.words.size());
    for (const auto& [word, count] : base.words.items()) {
        words.push_back(word);
    }

    std::vector<text::Counter::Entry> selected = base.words.most_common(budget);

    std::vector<int> lengths;
    for (int n : params.token_list) {
        if (n > 0) lengths.push_back(n);
    }
    std::sort(lengths.begin(), lengths.end(), std::greater<int>());
    lengths.erase(std::unique(lengths.begin(), lengths.end()), lengths.end());

    for (int length : lengths) {
        auto start = std::chrono::steady_clock::now();

        text::Counter candidates;
        auto qit = base.qgrams.find(length);
        if (qit != base.qgrams.end()) {
            for (const auto& [qgram, count] : qit->second.items()) {
                if (filter_(qgram, length)) {
                    candidates.set(qgram, count);
                }
            }
        }
        for (const auto& [token, credit] : selected) {
            const int64_t freq = base.frequency(token);
            if (freq == 0) continue;
            candidates.set(token, freq);
        }
        candidates.set_update_calls(base.update_calls);

        // Candidates may exceed the budget; the exponent is derived from their count
        const text::Vocabulary vocabulary(params, std::move(candidates), -1, symbols_);
        const text::SeqTokenizer tokenizer(vocabulary);

        auto sets = pool_.parallel_map(words.size(), [&](size_t i) {
            auto tokens = unique_tokens(tokenizer.tokenize(words[i]));
            tokens.erase(std::remove(tokens.begin(), tokens.end(), marker), tokens.end());
            return tokens;
        });

        // Ordered reduce keeps ties deterministic
        text::Counter credit;
        for (size_t i = 0; i < words.size(); ++i) {
            const int64_t freq = base.words.get(words[i]);
            for (const auto& token : sets[i]) {
                credit.add(token, freq);
            }
        }
        selected = credit.most_common(budget);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        LOG_INFO("q-gram length ", length, ": ", vocabulary.size(), " candidates, ",
                 selected.size(), " kept (", elapsed, " ms)");
    }

    return selected;
}

text::Vocabulary VocabularyBuilder::build(const BaseVocabulary& base,
                                          const text::TextModelParams& params,
                                          const std::vector<std::string>& corpus) const {
    const text::Vocabulary refined(params, text::Counter(refine(base, params), base.update_calls),
                                   options_.size_exponent, symbols_);
    const text::SeqTokenizer tokenizer(refined);

    const size_t n = corpus_size(corpus);
    auto sets = pool_.parallel_map(n, [&](size_t i) {
        return unique_tokens(tokenizer.tokenize(corpus[i]));
    });

    text::Counter counter;
    for (const auto& tokens : sets) {
        counter.update(tokens);
    }

    text::Counter final_counter(counter.most_common(options_.budget()), counter.update_calls());
    LOG_INFO("Vocabulary ", refined.identifier(), ": ", final_counter.size(),
             " tokens over ", final_counter.update_calls(), " records");
    return text::Vocabulary(params, std::move(final_counter), options_.size_exponent, symbols_);
}

text::Vocabulary VocabularyBuilder::build(const std::vector<std::string>& corpus) const {
    const text::TextNormalizer base_model(text::TextModelParams::for_language(options_.lang));

    const size_t n = corpus_size(corpus);
    const std::vector<std::string> records(corpus.begin(), corpus.begin() + static_cast<std::ptrdiff_t>(n));

    const BaseVocabulary base = split_base_vocabulary(compute_base_vocabulary(records, base_model, pool_));
    return build(base, base_model.params(), records);
}

} // namespace tokvec::build
