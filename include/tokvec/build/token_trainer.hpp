/**
 * Token Classifier Trainer
 *
 * For every vocabulary token seen at least min_pos times in the corpus, a
 * binary linear classifier learns to predict the token from the rest of the
 * record it occurs in. The coefficient vector of that classifier becomes the
 * token's row of the embedding matrix.
 *
 * Tokens train independently: the fan-out shares only the read-only
 * encoded corpus and vocabulary, and each token draws from its own RNG
 * seeded with seed + position, so results do not depend on the thread count.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tokvec/build/token_dataset.hpp"
#include "tokvec/model/linear_classifier.hpp"
#include "tokvec/text/counter.hpp"
#include "tokvec/text/seq_tokenizer.hpp"
#include "tokvec/text/vocabulary.hpp"
#include "tokvec/thread_pool.hpp"
#include "tokvec/types.hpp"

namespace tokvec::build {

struct TrainerOptions {
    size_t min_pos = 512;
    size_t max_pos = 8192;
    size_t negative_cap = 1024;
    Precision precision = Precision::Float32;
    bool intercept = false;             // Fit an intercept in the default classifier
    uint64_t seed = 0;

    static TrainerOptions from_config();
};

/**
 * Corpus re-tokenized with the vocabulary: one id set per record, plus the
 * occurrence count of every token emitted.
 */
struct EncodedCorpus {
    std::vector<TokenIdSet> records;
    text::Counter counts;
};

EncodedCorpus encode_corpus(const text::SeqTokenizer& tokenizer,
                            const text::Vocabulary& vocabulary,
                            const std::vector<std::string>& texts,
                            ThreadPool& pool = ThreadPool::instance());

// Vocabulary tokens in lexicographic order whose count reaches min_pos
std::vector<std::string> feasible_tokens(const text::Vocabulary& vocabulary,
                                         const text::Counter& counts, size_t min_pos);

using ClassifierFactory = std::function<std::unique_ptr<model::LinearClassifier>()>;

class TokenTrainer {
public:
    /**
     * @param factory    Classifier per token; defaults to a class-balanced LinearSVC
     * @param projection Example features; defaults to bag_of_tokens
     */
    TokenTrainer(std::shared_ptr<const text::Vocabulary> vocabulary,
                 TrainerOptions options = {},
                 ClassifierFactory factory = {},
                 FeatureProjection projection = {});

    // nullopt when one of the classes is empty
    std::optional<TrainedTokenArtifact> train_one(const std::string& label,
                                                  const EncodedCorpus& corpus,
                                                  uint64_t seed) const;

    // Artifacts of the feasible tokens that produced one, in feasible order
    std::vector<TrainedTokenArtifact> train(const EncodedCorpus& corpus,
                                            ThreadPool& pool = ThreadPool::instance()) const;

    const TrainerOptions& options() const { return options_; }

private:
    std::shared_ptr<const text::Vocabulary> vocabulary_;
    TrainerOptions options_;
    ClassifierFactory factory_;
    FeatureProjection projection_;
};

/**
 * Encodes the corpus, trains every feasible token and writes the model file.
 * Returns the number of token classifiers written.
 */
size_t build_embedding_model(std::shared_ptr<const text::Vocabulary> vocabulary,
                             const std::vector<std::string>& texts,
                             const std::string& output,
                             const TrainerOptions& options,
                             ThreadPool& pool = ThreadPool::instance());

} // namespace tokvec::build
