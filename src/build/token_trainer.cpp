#include "tokvec/build/token_trainer.hpp"
#include "tokvec/config.hpp"
#include "tokvec/error.hpp"
#include "tokvec/io/artifact_io.hpp"
#include "tokvec/logging.hpp"
#include "tokvec/model/linear_svc.hpp"

#include <algorithm>
#include <chrono>

namespace tokvec::build {

TrainerOptions TrainerOptions::from_config() {
    const Config& config = Config::getInstance();
    TrainerOptions options;
    options.min_pos = config.get<size_t>("train.min_pos", options.min_pos);
    options.max_pos = config.get<size_t>("train.max_pos", options.max_pos);
    options.negative_cap = config.get<size_t>("train.negative_cap", options.negative_cap);
    options.precision = parse_precision(config.get<std::string>("train.precision", "float32"));
    options.intercept = config.get<bool>("train.intercept", options.intercept);
    options.seed = config.get<uint64_t>("train.seed", options.seed);
    return options;
}

// =============================================================================
// Corpus encoding
// =============================================================================

EncodedCorpus encode_corpus(const text::SeqTokenizer& tokenizer,
                            const text::Vocabulary& vocabulary,
                            const std::vector<std::string>& texts,
                            ThreadPool& pool) {
    auto sequences = pool.parallel_map(texts.size(), [&](size_t i) {
        return tokenizer.tokenize(texts[i]);
    });

    EncodedCorpus corpus;
    corpus.records.reserve(sequences.size());
    for (const auto& tokens : sequences) {
        corpus.counts.update(tokens);
        corpus.records.push_back(vocabulary.to_ids(tokens));
    }
    LOG_INFO("Encoded ", corpus.records.size(), " records (", corpus.counts.size(), " distinct tokens)");
    return corpus;
}

std::vector<std::string> feasible_tokens(const text::Vocabulary& vocabulary,
                                         const text::Counter& counts, size_t min_pos) {
    std::vector<std::string> tokens = vocabulary.names();
    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                [&](const std::string& token) {
                                    return counts.get(token) < static_cast<int64_t>(min_pos);
                                }),
                 tokens.end());
    return tokens;
}

// =============================================================================
// TokenTrainer
// =============================================================================

TokenTrainer::TokenTrainer(std::shared_ptr<const text::Vocabulary> vocabulary,
                           TrainerOptions options,
                           ClassifierFactory factory,
                           FeatureProjection projection)
    : vocabulary_(std::move(vocabulary))
    , options_(options)
    , factory_(std::move(factory))
    , projection_(std::move(projection)) {
    TOKVEC_CHECK_ARGUMENT(vocabulary_ != nullptr, "TokenTrainer needs a vocabulary");
    if (!factory_) {
        const bool intercept = options_.intercept;
        factory_ = [intercept]() {
            model::LinearSVCOptions svc;
            svc.class_weight_balanced = true;
            svc.fit_intercept = intercept;
            return std::make_unique<model::LinearSVC>(svc);
        };
    }
    if (!projection_) {
        projection_ = bag_of_tokens;
    }
}

std::optional<TrainedTokenArtifact> TokenTrainer::train_one(const std::string& label,
                                                            const EncodedCorpus& corpus,
                                                            uint64_t seed) const {
    const uint32_t id = vocabulary_->id(label);
    std::mt19937_64 rng(seed);

    auto dataset = build_token_dataset(id, corpus.records, options_.max_pos,
                                       options_.negative_cap, rng);
    if (!dataset) {
        LOG_DEBUG("Skipping '", label, "': one of the classes is empty");
        return std::nullopt;
    }

    std::vector<TokenIdSet> examples = std::move(dataset->positives);
    const size_t n_pos = examples.size();
    examples.insert(examples.end(),
                    std::make_move_iterator(dataset->negatives.begin()),
                    std::make_move_iterator(dataset->negatives.end()));

    std::vector<int> y(examples.size(), 0);
    std::fill(y.begin(), y.begin() + static_cast<std::ptrdiff_t>(n_pos), 1);

    const SparseMatrix X = projection_(examples, vocabulary_->size());
    std::unique_ptr<model::LinearClassifier> classifier = factory_();
    classifier->fit(X, y);

    const Matrix& coef = classifier->coef();
    if (coef.rows() != 1 || static_cast<size_t>(coef.cols()) != vocabulary_->size()) {
        throw NumericalError("Classifier for '" + label + "' returned a " + std::to_string(coef.rows()) +
                             " x " + std::to_string(coef.cols()) + " coefficient matrix", __func__);
    }

    TrainedTokenArtifact artifact;
    artifact.label = label;
    artifact.N = y.size();
    artifact.coef = coef.row(0).transpose();
    round_to_precision(artifact.coef, options_.precision);
    artifact.intercept = classifier->intercept().size() > 0 ? classifier->intercept()[0] : 0.0f;
    return artifact;
}

std::vector<TrainedTokenArtifact> TokenTrainer::train(const EncodedCorpus& corpus,
                                                      ThreadPool& pool) const {
    const std::vector<std::string> tokens =
        feasible_tokens(*vocabulary_, corpus.counts, options_.min_pos);
    LOG_INFO("Training ", tokens.size(), " of ", vocabulary_->size(), " tokens (min_pos=",
             options_.min_pos, ") on ", pool.num_threads(), " threads");

    auto start = std::chrono::steady_clock::now();
    auto results = pool.parallel_map(tokens.size(), [&](size_t i) {
        return train_one(tokens[i], corpus, options_.seed + i);
    });

    std::vector<TrainedTokenArtifact> artifacts;
    artifacts.reserve(results.size());
    for (auto& result : results) {
        if (result) artifacts.push_back(std::move(*result));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    LOG_INFO("Trained ", artifacts.size(), " token classifiers in ", elapsed, " ms (",
             tokens.size() - artifacts.size(), " skipped)");
    return artifacts;
}

// =============================================================================
// Pipeline
// =============================================================================

size_t build_embedding_model(std::shared_ptr<const text::Vocabulary> vocabulary,
                             const std::vector<std::string>& texts,
                             const std::string& output,
                             const TrainerOptions& options,
                             ThreadPool& pool) {
    const text::SeqTokenizer tokenizer(*vocabulary);
    const EncodedCorpus corpus = encode_corpus(tokenizer, *vocabulary, texts, pool);

    const TokenTrainer trainer(vocabulary, options);
    const std::vector<TrainedTokenArtifact> artifacts = trainer.train(corpus, pool);

    io::save_model(output, *vocabulary, artifacts, options.precision);
    return artifacts.size();
}

} // namespace tokvec::build
