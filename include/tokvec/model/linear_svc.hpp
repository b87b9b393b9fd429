/**
 * L2-regularized squared-hinge linear SVM.
 *
 * Dual coordinate descent with shrinking:
 *   min_a  1/2 a'Qa - e'a,  a >= 0,  Q = yy'XX' + D,  D_ii = 1 / (2 C_i)
 * The primal weights are kept in step with the duals (w = sum a_i y_i x_i),
 * so each coordinate update costs one sparse row product. The intercept is
 * learned as the weight of a constant feature equal to intercept_scaling.
 * More than two classes are handled one-vs-rest.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "tokvec/model/linear_classifier.hpp"

namespace tokvec::model {

struct LinearSVCOptions {
    double C = 1.0;
    double tol = 1e-4;
    int max_iter = 1000;
    bool fit_intercept = true;
    double intercept_scaling = 1.0;
    bool class_weight_balanced = false;    // n / (n_classes * n_c) per class
    uint64_t seed = 0;                     // Coordinate order
};

class LinearSVC : public LinearClassifier {
public:
    explicit LinearSVC(LinearSVCOptions options = {});

    void fit(const SparseMatrix& X, const std::vector<int>& y) override;
    void fit(const Matrix& X, const std::vector<int>& y) override;

    Matrix decision_function(const Matrix& X) const override;
    Matrix decision_function(const SparseMatrix& X) const;

    const Matrix& coef() const override { return coef_; }
    const Vector& intercept() const override { return intercept_; }
    const std::vector<int>& classes() const override { return classes_; }

    std::unique_ptr<LinearClassifier> clone() const override;

    const LinearSVCOptions& options() const { return options_; }

    // Coordinate-descent sweeps of the last binary sub-problem
    int iterations() const { return iterations_; }

private:
    template<typename Mat>
    void fit_impl(const Mat& X, const std::vector<int>& y);

    LinearSVCOptions options_;
    Matrix coef_;
    Vector intercept_;
    std::vector<int> classes_;
    int iterations_ = 0;
};

} // namespace tokvec::model
