/**
 * Embedding matrix assembled from per-token classifiers.
 *
 * Row r holds the coefficients of the classifier trained for names()[r];
 * columns span the vocabulary. Adjustments return a new matrix unless
 * inplace is requested, so callers holding a model never see it change
 * behind their back.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tokvec/text/vocabulary.hpp"
#include "tokvec/types.hpp"

namespace tokvec::model {

struct AssembleOptions {
    bool merge_idf = true;      // Scale every row by the vocabulary IDF
    bool force_token = true;    // Set each row's own column to the row maximum
    bool intercept = false;     // Affine transform; excludes merge_idf
    Precision precision = Precision::Float32;
};

class EmbeddingModel {
public:
    EmbeddingModel(std::shared_ptr<const text::Vocabulary> vocabulary,
                   Matrix weights, Vector bias, std::vector<std::string> names);

    /**
     * Stacks artifacts in the given order and applies the requested
     * adjustments. Throws InvalidArgumentError for intercept with merge_idf
     * and MalformedArtifactError for artifacts that do not fit the
     * vocabulary.
     */
    static EmbeddingModel assemble(std::shared_ptr<const text::Vocabulary> vocabulary,
                                   const std::vector<TrainedTokenArtifact>& artifacts,
                                   const AssembleOptions& options = {});

    // weights .* idf per row, rounded through precision
    Matrix merge_idf(Precision precision = Precision::Float32, bool inplace = false);

    /**
     * W[r, id(names[r])] = max_j W[r, j]. With idf the maximum is taken over
     * the IDF-scaled row and divided by the IDF of the row's own column.
     */
    Matrix force_token(bool idf = false, bool inplace = false);

    /**
     * Full-vocabulary matrix: trained rows copied to their vocabulary slot,
     * every other row exactly zero. inplace also replaces bias and names.
     */
    Matrix fill(bool inplace = false);

    const text::Vocabulary& vocabulary() const { return *vocabulary_; }
    std::shared_ptr<const text::Vocabulary> vocabulary_ptr() const { return vocabulary_; }

    const Matrix& weights() const { return weights_; }
    const Vector& bias() const { return bias_; }
    const std::vector<std::string>& names() const { return names_; }

    Eigen::Index rows() const { return weights_.rows(); }
    Eigen::Index dimension() const { return weights_.cols(); }

private:
    std::vector<uint32_t> row_columns() const;

    std::shared_ptr<const text::Vocabulary> vocabulary_;
    Matrix weights_;
    Vector bias_;
    std::vector<std::string> names_;
};

} // namespace tokvec::model
