#include "tokvec/model/linear_svc.hpp"
#include "tokvec/error.hpp"
#include "tokvec/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <random>

namespace tokvec::model {

namespace {

// =============================================================================
// Row access shared by the sparse and dense solvers
// =============================================================================

double row_dot(const SparseMatrix& X, Eigen::Index i, const Eigen::VectorXd& w) {
    double sum = 0.0;
    for (SparseMatrix::InnerIterator it(X, i); it; ++it) {
        sum += static_cast<double>(it.value()) * w[it.col()];
    }
    return sum;
}

double row_dot(const Matrix& X, Eigen::Index i, const Eigen::VectorXd& w) {
    return X.row(i).cast<double>().dot(w.head(X.cols()));
}

void row_axpy(const SparseMatrix& X, Eigen::Index i, double a, Eigen::VectorXd& w) {
    for (SparseMatrix::InnerIterator it(X, i); it; ++it) {
        w[it.col()] += a * static_cast<double>(it.value());
    }
}

void row_axpy(const Matrix& X, Eigen::Index i, double a, Eigen::VectorXd& w) {
    w.head(X.cols()) += a * X.row(i).transpose().cast<double>();
}

double row_sqnorm(const SparseMatrix& X, Eigen::Index i) {
    double sum = 0.0;
    for (SparseMatrix::InnerIterator it(X, i); it; ++it) {
        sum += static_cast<double>(it.value()) * static_cast<double>(it.value());
    }
    return sum;
}

double row_sqnorm(const Matrix& X, Eigen::Index i) {
    return X.row(i).cast<double>().squaredNorm();
}

/**
 * One binary problem. sign[i] is +1 / -1; w has X.cols() entries plus one
 * for the constant feature (zero when bias == 0). Returns sweeps used.
 */
template<typename Mat>
int solve_l2loss_dual(const Mat& X, const std::vector<int8_t>& sign,
                      double Cp, double Cn, double bias, const LinearSVCOptions& options,
                      Eigen::VectorXd& w) {
    const Eigen::Index n = X.rows();
    const Eigen::Index d = X.cols();
    constexpr double INF = std::numeric_limits<double>::infinity();

    std::vector<double> alpha(static_cast<size_t>(n), 0.0);
    std::vector<double> diag(static_cast<size_t>(n));
    std::vector<double> QD(static_cast<size_t>(n));
    std::vector<size_t> index(static_cast<size_t>(n));

    w.setZero(d + 1);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto s = static_cast<size_t>(i);
        diag[s] = 0.5 / (sign[s] > 0 ? Cp : Cn);
        QD[s] = diag[s] + row_sqnorm(X, i) + bias * bias;
        index[s] = s;
    }

    std::mt19937_64 rng(options.seed);
    size_t active_size = static_cast<size_t>(n);
    double PGmax_old = INF;
    int iter = 0;

    while (iter < options.max_iter) {
        double PGmax_new = -INF;
        double PGmin_new = INF;

        for (size_t s = 0; s < active_size; ++s) {
            std::uniform_int_distribution<size_t> pick(s, active_size - 1);
            std::swap(index[s], index[pick(rng)]);
        }

        for (size_t s = 0; s < active_size; ++s) {
            const size_t i = index[s];
            const auto row = static_cast<Eigen::Index>(i);
            const double yi = sign[i];

            const double G = yi * (row_dot(X, row, w) + w[d] * bias) - 1.0 + alpha[i] * diag[i];

            double PG = 0.0;
            if (alpha[i] == 0.0) {
                if (G > PGmax_old) {
                    // Shrink: bound variable unlikely to move
                    --active_size;
                    std::swap(index[s], index[active_size]);
                    --s;
                    continue;
                }
                if (G < 0.0) PG = G;
            } else {
                PG = G;
            }

            PGmax_new = std::max(PGmax_new, PG);
            PGmin_new = std::min(PGmin_new, PG);

            if (std::fabs(PG) > 1e-12) {
                const double alpha_old = alpha[i];
                alpha[i] = std::max(alpha[i] - G / QD[i], 0.0);
                const double delta = (alpha[i] - alpha_old) * yi;
                row_axpy(X, row, delta, w);
                w[d] += delta * bias;
            }
        }

        ++iter;

        if (PGmax_new - PGmin_new <= options.tol) {
            if (active_size == static_cast<size_t>(n)) break;
            // Converged on the shrunk set; verify on everything
            active_size = static_cast<size_t>(n);
            PGmax_old = INF;
            continue;
        }

        PGmax_old = PGmax_new <= 0 ? INF : PGmax_new;
    }

    if (iter >= options.max_iter) {
        LOG_DEBUG("Dual coordinate descent reached max_iter=", options.max_iter,
                  "; consider a larger max_iter or feature scaling");
    }
    return iter;
}

} // namespace

// =============================================================================
// LinearClassifier
// =============================================================================

std::vector<int> LinearClassifier::predict(const Matrix& X) const {
    const Matrix scores = decision_function(X);
    const auto& labels = classes();
    std::vector<int> result(static_cast<size_t>(scores.rows()));

    for (Eigen::Index i = 0; i < scores.rows(); ++i) {
        if (scores.cols() == 1) {
            result[static_cast<size_t>(i)] = scores(i, 0) > 0 ? labels[1] : labels[0];
        } else {
            Eigen::Index best;
            scores.row(i).maxCoeff(&best);
            result[static_cast<size_t>(i)] = labels[static_cast<size_t>(best)];
        }
    }
    return result;
}

// =============================================================================
// LinearSVC
// =============================================================================

LinearSVC::LinearSVC(LinearSVCOptions options) : options_(options) {
    TOKVEC_CHECK_ARGUMENT(options_.C > 0, "C must be positive");
    TOKVEC_CHECK_ARGUMENT(options_.tol > 0, "tol must be positive");
    TOKVEC_CHECK_ARGUMENT(options_.max_iter > 0, "max_iter must be positive");
}

void LinearSVC::fit(const SparseMatrix& X, const std::vector<int>& y) {
    fit_impl(X, y);
}

void LinearSVC::fit(const Matrix& X, const std::vector<int>& y) {
    fit_impl(X, y);
}

template<typename Mat>
void LinearSVC::fit_impl(const Mat& X, const std::vector<int>& y) {
    TOKVEC_CHECK_ARGUMENT(static_cast<size_t>(X.rows()) == y.size(),
                          "X and y have a different number of samples");
    TOKVEC_CHECK_ARGUMENT(X.rows() > 0, "Cannot fit on an empty dataset");

    std::map<int, size_t> counts;
    for (int label : y) ++counts[label];
    if (counts.size() < 2) {
        throw InvalidArgumentError("At least two classes are needed to fit, got " +
                                   std::to_string(counts.size()), __func__);
    }

    classes_.clear();
    std::vector<double> class_weight;
    const double n = static_cast<double>(y.size());
    for (const auto& [label, count] : counts) {
        classes_.push_back(label);
        class_weight.push_back(options_.class_weight_balanced
                                   ? n / (static_cast<double>(counts.size()) * static_cast<double>(count))
                                   : 1.0);
    }

    const double bias = options_.fit_intercept ? options_.intercept_scaling : 0.0;
    const size_t n_problems = classes_.size() == 2 ? 1 : classes_.size();
    coef_.resize(static_cast<Eigen::Index>(n_problems), X.cols());
    intercept_.setZero(static_cast<Eigen::Index>(n_problems));

    std::vector<int8_t> sign(y.size());
    Eigen::VectorXd w;
    for (size_t k = 0; k < n_problems; ++k) {
        // Binary problems score classes_[1]; one-vs-rest weighs only the positive class
        const size_t positive = n_problems == 1 ? 1 : k;
        for (size_t i = 0; i < y.size(); ++i) {
            sign[i] = y[i] == classes_[positive] ? 1 : -1;
        }
        const double Cp = options_.C * class_weight[positive];
        const double Cn = n_problems == 1 ? options_.C * class_weight[0] : options_.C;

        iterations_ = solve_l2loss_dual(X, sign, Cp, Cn, bias, options_, w);

        const auto row = static_cast<Eigen::Index>(k);
        coef_.row(row) = w.head(X.cols()).template cast<float>().transpose();
        intercept_[row] = static_cast<float>(w[X.cols()] * bias);
    }
}

Matrix LinearSVC::decision_function(const Matrix& X) const {
    TOKVEC_CHECK(coef_.size() > 0, ErrorCode::INVALID_ARGUMENT, "LinearSVC is not fitted");
    TOKVEC_CHECK_ARGUMENT(X.cols() == coef_.cols(), "Feature dimension does not match the fitted model");
    Matrix scores = X * coef_.transpose();
    scores.rowwise() += intercept_.transpose();
    return scores;
}

Matrix LinearSVC::decision_function(const SparseMatrix& X) const {
    TOKVEC_CHECK(coef_.size() > 0, ErrorCode::INVALID_ARGUMENT, "LinearSVC is not fitted");
    TOKVEC_CHECK_ARGUMENT(X.cols() == coef_.cols(), "Feature dimension does not match the fitted model");
    Matrix scores = X * coef_.transpose();
    scores.rowwise() += intercept_.transpose();
    return scores;
}

std::unique_ptr<LinearClassifier> LinearSVC::clone() const {
    return std::make_unique<LinearSVC>(options_);
}

} // namespace tokvec::model
