/**
 * Encoder: text -> dense vector through an embedding model, plus a linear
 * classifier over those vectors.
 *
 * The encoder owns its model, its tokenizer and its classifier. The
 * tokenizer is derived from the model vocabulary at construction; rebuild()
 * derives it again after the model was replaced.
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "tokvec/model/embedding_model.hpp"
#include "tokvec/model/linear_classifier.hpp"
#include "tokvec/model/linear_svc.hpp"
#include "tokvec/text/seq_tokenizer.hpp"
#include "tokvec/thread_pool.hpp"

namespace tokvec::model {

struct EncoderConfig {
    AssembleOptions assemble;
    size_t kfold = 5;
    bool kfold_shuffle = true;
    uint64_t kfold_seed = 0;
    LinearSVCOptions classifier = LinearSVCOptions{.class_weight_balanced = true};

    static EncoderConfig from_config();
};

class Encoder {
public:
    // classifier == nullptr selects a LinearSVC built from config.classifier
    explicit Encoder(EmbeddingModel model, EncoderConfig config = {},
                     std::unique_ptr<LinearClassifier> classifier = nullptr,
                     ThreadPool& pool = ThreadPool::instance());

    /**
     * Loads a model file written at config.assemble.precision and assembles it.
     * Pass the symbol table the vocabulary was trained with so symbol rows are
     * reachable from text.
     */
    static Encoder load(const std::string& path, EncoderConfig config = {},
                        text::SymbolTable symbols = {},
                        ThreadPool& pool = ThreadPool::instance());

    Encoder(Encoder&&) = default;
    Encoder& operator=(Encoder&&) = default;
    Encoder(const Encoder&) = delete;
    Encoder& operator=(const Encoder&) = delete;

    /**
     * Weight columns of the text's in-vocabulary tokens, in order and with
     * repeats. A text without any known token yields one all-ones column.
     */
    Matrix encode(std::string_view text) const;

    /**
     * One L2-normalized row per text: the sum of encode() columns, or
     * bag * W^T + bias in intercept mode. Zero rows stay zero.
     */
    Matrix transform(const std::vector<std::string>& texts) const;

    Encoder& fit(const std::vector<std::string>& texts, const std::vector<int>& labels);
    std::vector<int> predict(const std::vector<std::string>& texts) const;

    // n x 1 for two classes, n x n_classes otherwise
    Matrix decision_function(const std::vector<std::string>& texts) const;

    /**
     * Out-of-fold decision values: every row is scored by a classifier
     * clone that was fit on the other folds only.
     */
    Matrix train_predict_decision_function(const std::vector<std::string>& texts,
                                           const std::vector<int>& labels) const;

    // Independent copy: same configuration, copied matrix, own tokenizer, unfitted classifier
    Encoder clone() const;

    void rebuild();

    const EmbeddingModel& model() const { return model_; }
    EmbeddingModel& model() { return model_; }
    const text::SeqTokenizer& tokenizer() const { return *tokenizer_; }
    const LinearClassifier& classifier() const { return *classifier_; }
    const EncoderConfig& config() const { return config_; }

private:
    Vector bag(std::string_view text) const;

    EncoderConfig config_;
    EmbeddingModel model_;
    std::unique_ptr<LinearClassifier> classifier_;
    std::unique_ptr<text::SeqTokenizer> tokenizer_;
    ThreadPool* pool_;
};

} // namespace tokvec::model
