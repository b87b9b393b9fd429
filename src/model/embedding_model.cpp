#include "tokvec/model/embedding_model.hpp"
#include "tokvec/error.hpp"
#include "tokvec/logging.hpp"

namespace tokvec::model {

EmbeddingModel::EmbeddingModel(std::shared_ptr<const text::Vocabulary> vocabulary,
                               Matrix weights, Vector bias, std::vector<std::string> names)
    : vocabulary_(std::move(vocabulary))
    , weights_(std::move(weights))
    , bias_(std::move(bias))
    , names_(std::move(names)) {
    TOKVEC_CHECK_ARGUMENT(vocabulary_ != nullptr, "EmbeddingModel needs a vocabulary");
    TOKVEC_CHECK_ARGUMENT(static_cast<size_t>(weights_.rows()) == names_.size(),
                          "One name per weight row is required");
    TOKVEC_CHECK_ARGUMENT(bias_.size() == weights_.rows(), "One bias per weight row is required");
    TOKVEC_CHECK_ARGUMENT(static_cast<size_t>(weights_.cols()) == vocabulary_->size(),
                          "Weight columns must span the vocabulary");
}

EmbeddingModel EmbeddingModel::assemble(std::shared_ptr<const text::Vocabulary> vocabulary,
                                        const std::vector<TrainedTokenArtifact>& artifacts,
                                        const AssembleOptions& options) {
    TOKVEC_CHECK_ARGUMENT(vocabulary != nullptr, "assemble needs a vocabulary");
    if (options.intercept && options.merge_idf) {
        throw InvalidArgumentError("intercept and merge_idf cannot be combined", __func__,
                                   "Disable merge_idf for the affine transform");
    }

    const auto dim = static_cast<Eigen::Index>(vocabulary->size());
    Matrix weights(static_cast<Eigen::Index>(artifacts.size()), dim);
    Vector bias(static_cast<Eigen::Index>(artifacts.size()));
    std::vector<std::string> names;
    names.reserve(artifacts.size());

    for (size_t r = 0; r < artifacts.size(); ++r) {
        const auto& artifact = artifacts[r];
        if (artifact.coef.size() != dim) {
            throw MalformedArtifactError("Artifact '" + artifact.label + "' has " +
                                         std::to_string(artifact.coef.size()) +
                                         " coefficients, vocabulary has " + std::to_string(dim),
                                         __func__);
        }
        if (!vocabulary->contains(artifact.label)) {
            throw MalformedArtifactError("Artifact label '" + artifact.label + "' is not in the vocabulary",
                                         __func__);
        }
        const auto row = static_cast<Eigen::Index>(r);
        weights.row(row) = artifact.coef.transpose();
        bias[row] = artifact.intercept;
        names.push_back(artifact.label);
    }
    round_to_precision(bias, options.precision);

    EmbeddingModel model(std::move(vocabulary), std::move(weights), std::move(bias), std::move(names));
    if (options.merge_idf) {
        model.merge_idf(options.precision, true);
    }
    if (options.force_token) {
        model.force_token(options.intercept, true);
    }

    LOG_DEBUG("Assembled ", model.rows(), " x ", model.dimension(), " embedding (merge_idf=",
              options.merge_idf, ", force_token=", options.force_token, ")");
    return model;
}

std::vector<uint32_t> EmbeddingModel::row_columns() const {
    std::vector<uint32_t> columns;
    columns.reserve(names_.size());
    for (const auto& name : names_) {
        columns.push_back(vocabulary_->id(name));
    }
    return columns;
}

Matrix EmbeddingModel::merge_idf(Precision precision, bool inplace) {
    Matrix scaled = weights_ * vocabulary_->idf().asDiagonal();
    round_to_precision(scaled, precision);
    if (inplace) {
        weights_ = scaled;
    }
    return scaled;
}

Matrix EmbeddingModel::force_token(bool idf, bool inplace) {
    Matrix result = weights_;
    if (result.size() == 0) {
        if (inplace) weights_ = result;
        return result;
    }

    const Vector& weights = vocabulary_->idf();
    const std::vector<uint32_t> columns = row_columns();

    for (Eigen::Index r = 0; r < result.rows(); ++r) {
        const auto col = static_cast<Eigen::Index>(columns[static_cast<size_t>(r)]);
        float value = weights_.row(r).maxCoeff();
        if (idf && weights[col] != 0.0f) {
            value = weights_.row(r).cwiseProduct(weights.transpose()).maxCoeff() / weights[col];
        }
        result(r, col) = value;
    }

    if (inplace) {
        weights_ = result;
    }
    return result;
}

Matrix EmbeddingModel::fill(bool inplace) {
    const auto n = static_cast<Eigen::Index>(vocabulary_->size());
    Matrix full = Matrix::Zero(n, weights_.cols());
    Vector full_bias = Vector::Zero(n);

    const std::vector<uint32_t> columns = row_columns();
    for (Eigen::Index r = 0; r < weights_.rows(); ++r) {
        const auto slot = static_cast<Eigen::Index>(columns[static_cast<size_t>(r)]);
        full.row(slot) = weights_.row(r);
        full_bias[slot] = bias_[r];
    }

    if (inplace) {
        weights_ = full;
        bias_ = full_bias;
        names_ = vocabulary_->names();
    }
    return full;
}

} // namespace tokvec::model
