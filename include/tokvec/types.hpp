#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <Eigen/Sparse>

namespace tokvec {

// =============================================================================
// Matrix types
// =============================================================================

// Embedding matrices and transformed features are kept in single precision
using Matrix = Eigen::MatrixXf;
using Vector = Eigen::VectorXf;

// Bag-of-tokens classifier inputs (one row per example)
using SparseMatrix = Eigen::SparseMatrix<float, Eigen::RowMajor>;

// Sorted, de-duplicated vocabulary ids of one corpus record
using TokenIdSet = std::vector<uint32_t>;

// =============================================================================
// Storage precision
// =============================================================================

/**
 * Width of the persisted coefficient buffers. The width is declared by the
 * reader and writer of a model file; it is never stored inside the file.
 */
enum class Precision {
    Float16,
    Float32,
    Float64
};

// Bytes per persisted coefficient
constexpr size_t precision_width(Precision p) noexcept {
    switch (p) {
        case Precision::Float16: return 2;
        case Precision::Float32: return 4;
        case Precision::Float64: return 8;
    }
    return 4;
}

const char* precision_name(Precision p) noexcept;

// Accepts "float16", "float32", "float64" (and the f16/f32/f64 short forms)
Precision parse_precision(const std::string& name);

// Rounds every entry through the given storage precision
void round_to_precision(Vector& values, Precision p);
void round_to_precision(Matrix& values, Precision p);

// =============================================================================
// Trained token artifact
// =============================================================================

/**
 * Output of one per-token classifier: the coefficients span the whole
 * vocabulary dimension.
 */
struct TrainedTokenArtifact {
    std::string label;
    size_t N = 0;               // Examples the classifier was fit on
    Vector coef;
    float intercept = 0.0f;
};

} // namespace tokvec
