#pragma once

#include <memory>
#include <vector>

#include "tokvec/types.hpp"

namespace tokvec::model {

/**
 * Linear decision capability used by the token trainer and the encoder.
 *
 * coef() has one row per decision column: a single row for two classes
 * (scoring classes()[1]), one row per class otherwise.
 */
class LinearClassifier {
public:
    virtual ~LinearClassifier() = default;

    virtual void fit(const SparseMatrix& X, const std::vector<int>& y) = 0;
    virtual void fit(const Matrix& X, const std::vector<int>& y) = 0;

    // n x 1 for binary problems, n x n_classes otherwise
    virtual Matrix decision_function(const Matrix& X) const = 0;

    virtual std::vector<int> predict(const Matrix& X) const;

    virtual const Matrix& coef() const = 0;
    virtual const Vector& intercept() const = 0;
    virtual const std::vector<int>& classes() const = 0;

    // Unfitted copy with the same hyper-parameters
    virtual std::unique_ptr<LinearClassifier> clone() const = 0;
};

} // namespace tokvec::model
