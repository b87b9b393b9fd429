#include "tokvec/model/encoder.hpp"
#include "tokvec/config.hpp"
#include "tokvec/error.hpp"
#include "tokvec/io/artifact_io.hpp"
#include "tokvec/logging.hpp"
#include "tokvec/model/kfold.hpp"
#include "tokvec/thread_pool.hpp"

#include <set>

namespace tokvec::model {

namespace {

Matrix select_rows(const Matrix& X, const std::vector<size_t>& rows) {
    Matrix out(static_cast<Eigen::Index>(rows.size()), X.cols());
    for (size_t i = 0; i < rows.size(); ++i) {
        out.row(static_cast<Eigen::Index>(i)) = X.row(static_cast<Eigen::Index>(rows[i]));
    }
    return out;
}

} // namespace

EncoderConfig EncoderConfig::from_config() {
    const Config& config = Config::getInstance();
    EncoderConfig result;
    result.assemble.merge_idf = config.get<bool>("encode.merge_idf", result.assemble.merge_idf);
    result.assemble.force_token = config.get<bool>("encode.force_token", result.assemble.force_token);
    result.assemble.intercept = config.get<bool>("train.intercept", result.assemble.intercept);
    result.assemble.precision = parse_precision(config.get<std::string>("train.precision", "float32"));
    result.kfold = config.get<size_t>("encode.kfold", result.kfold);
    result.kfold_seed = config.get<uint64_t>("train.seed", result.kfold_seed);
    if (result.assemble.intercept && result.assemble.merge_idf) {
        LOG_WARN("Intercept models are used without IDF merging; ignoring encode.merge_idf");
        result.assemble.merge_idf = false;
    }
    return result;
}

Encoder::Encoder(EmbeddingModel model, EncoderConfig config,
                 std::unique_ptr<LinearClassifier> classifier, ThreadPool& pool)
    : config_(config)
    , model_(std::move(model))
    , classifier_(std::move(classifier))
    , pool_(&pool) {
    if (!classifier_) {
        classifier_ = std::make_unique<LinearSVC>(config_.classifier);
    }
    rebuild();
}

Encoder Encoder::load(const std::string& path, EncoderConfig config, text::SymbolTable symbols,
                      ThreadPool& pool) {
    io::ModelArtifact artifact = io::load_model(path, config.assemble.precision, std::move(symbols));
    EmbeddingModel model = EmbeddingModel::assemble(artifact.vocabulary, artifact.artifacts, config.assemble);
    return Encoder(std::move(model), config, nullptr, pool);
}

void Encoder::rebuild() {
    tokenizer_ = std::make_unique<text::SeqTokenizer>(model_.vocabulary());
}

Encoder Encoder::clone() const {
    return Encoder(model_, config_, classifier_->clone(), *pool_);
}

// =============================================================================
// Encoding
// =============================================================================

Matrix Encoder::encode(std::string_view text) const {
    const text::Vocabulary& vocabulary = model_.vocabulary();
    std::vector<Eigen::Index> columns;
    for (const auto& token : tokenizer_->tokenize(text)) {
        if (auto id = vocabulary.find(token)) {
            columns.push_back(static_cast<Eigen::Index>(*id));
        }
    }

    const Matrix& W = model_.weights();
    if (columns.empty()) {
        return Matrix::Ones(W.rows(), 1);
    }
    return W(Eigen::all, columns);
}

Vector Encoder::bag(std::string_view text) const {
    const text::Vocabulary& vocabulary = model_.vocabulary();
    Vector b = Vector::Zero(static_cast<Eigen::Index>(vocabulary.size()));
    for (uint32_t id : vocabulary.to_ids(tokenizer_->tokenize(text))) {
        b[static_cast<Eigen::Index>(id)] = 1.0f;
    }
    return b;
}

Matrix Encoder::transform(const std::vector<std::string>& texts) const {
    const Matrix& W = model_.weights();
    Matrix X(static_cast<Eigen::Index>(texts.size()), W.rows());
    const bool affine = config_.assemble.intercept;

    pool_->parallel_for(0, texts.size(), [&](size_t i) {
        const auto row = static_cast<Eigen::Index>(i);
        if (affine) {
            X.row(row) = (W * bag(texts[i]) + model_.bias()).transpose();
        } else {
            X.row(row) = encode(texts[i]).rowwise().sum().transpose();
        }
        const float norm = X.row(row).norm();
        if (norm > 0.0f) {
            X.row(row) /= norm;
        }
    });
    return X;
}

// =============================================================================
// Classification
// =============================================================================

Encoder& Encoder::fit(const std::vector<std::string>& texts, const std::vector<int>& labels) {
    TOKVEC_CHECK_ARGUMENT(texts.size() == labels.size(), "texts and labels differ in length");
    classifier_->fit(transform(texts), labels);
    return *this;
}

std::vector<int> Encoder::predict(const std::vector<std::string>& texts) const {
    return classifier_->predict(transform(texts));
}

Matrix Encoder::decision_function(const std::vector<std::string>& texts) const {
    return classifier_->decision_function(transform(texts));
}

Matrix Encoder::train_predict_decision_function(const std::vector<std::string>& texts,
                                                const std::vector<int>& labels) const {
    TOKVEC_CHECK_ARGUMENT(texts.size() == labels.size(), "texts and labels differ in length");

    const std::set<int> classes(labels.begin(), labels.end());
    TOKVEC_CHECK_ARGUMENT(classes.size() >= 2, "At least two classes are required");

    const Matrix X = transform(texts);
    const Eigen::Index columns = classes.size() == 2 ? 1 : static_cast<Eigen::Index>(classes.size());
    Matrix hy = Matrix::Zero(X.rows(), columns);

    const StratifiedKFold kfold(config_.kfold, config_.kfold_shuffle, config_.kfold_seed);
    size_t fold = 0;
    for (const auto& [train, test] : kfold.split(labels)) {
        std::vector<int> y_train;
        y_train.reserve(train.size());
        for (size_t i : train) y_train.push_back(labels[i]);

        std::unique_ptr<LinearClassifier> fold_classifier = classifier_->clone();
        fold_classifier->fit(select_rows(X, train), y_train);
        const Matrix scores = fold_classifier->decision_function(select_rows(X, test));

        if (scores.cols() != columns) {
            throw InvalidArgumentError("Fold " + std::to_string(fold) + " training partition misses a class",
                                       __func__, "Use fewer folds or more examples per class");
        }
        for (size_t j = 0; j < test.size(); ++j) {
            hy.row(static_cast<Eigen::Index>(test[j])) = scores.row(static_cast<Eigen::Index>(j));
        }
        ++fold;
    }
    return hy;
}

} // namespace tokvec::model
