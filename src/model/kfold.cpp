#include "tokvec/model/kfold.hpp"
#include "tokvec/error.hpp"
#include "tokvec/logging.hpp"

#include <algorithm>
#include <map>
#include <random>

namespace tokvec::model {

StratifiedKFold::StratifiedKFold(size_t n_splits, bool shuffle, uint64_t seed)
    : n_splits_(n_splits), shuffle_(shuffle), seed_(seed) {
    TOKVEC_CHECK_ARGUMENT(n_splits_ >= 2, "StratifiedKFold needs at least 2 splits");
}

std::vector<StratifiedKFold::Split> StratifiedKFold::split(const std::vector<int>& y) const {
    if (y.size() < n_splits_) {
        throw InvalidArgumentError("Cannot split " + std::to_string(y.size()) + " samples into " +
                                   std::to_string(n_splits_) + " folds", __func__);
    }

    std::map<int, std::vector<size_t>> by_class;
    for (size_t i = 0; i < y.size(); ++i) {
        by_class[y[i]].push_back(i);
    }

    std::mt19937_64 rng(seed_);
    std::vector<std::vector<size_t>> test(n_splits_);

    // Deal each class round-robin; the offset carries over so fold sizes stay even
    size_t offset = 0;
    for (auto& [label, members] : by_class) {
        if (members.size() < n_splits_) {
            LOG_WARN("Class ", label, " has ", members.size(), " members, fewer than ",
                     n_splits_, " folds");
        }
        if (shuffle_) {
            std::shuffle(members.begin(), members.end(), rng);
        }
        for (size_t j = 0; j < members.size(); ++j) {
            test[(offset + j) % n_splits_].push_back(members[j]);
        }
        offset += members.size();
    }

    std::vector<Split> splits;
    splits.reserve(n_splits_);
    std::vector<char> in_test(y.size());
    for (auto& fold : test) {
        std::sort(fold.begin(), fold.end());
        std::fill(in_test.begin(), in_test.end(), 0);
        for (size_t i : fold) in_test[i] = 1;

        std::vector<size_t> train;
        train.reserve(y.size() - fold.size());
        for (size_t i = 0; i < y.size(); ++i) {
            if (!in_test[i]) train.push_back(i);
        }
        splits.emplace_back(std::move(train), std::move(fold));
    }
    return splits;
}

} // namespace tokvec::model
