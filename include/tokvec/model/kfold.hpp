#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace tokvec::model {

/**
 * Stratified k-fold partition: every index lands in exactly one test fold
 * and each class is spread over the folds in proportion.
 */
class StratifiedKFold {
public:
    using Split = std::pair<std::vector<size_t>, std::vector<size_t>>;  // (train, test)

    explicit StratifiedKFold(size_t n_splits = 5, bool shuffle = true, uint64_t seed = 0);

    std::vector<Split> split(const std::vector<int>& y) const;

    size_t n_splits() const { return n_splits_; }

private:
    size_t n_splits_;
    bool shuffle_;
    uint64_t seed_;
};

} // namespace tokvec::model
