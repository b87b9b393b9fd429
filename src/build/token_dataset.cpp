#include "tokvec/build/token_dataset.hpp"
#include "tokvec/error.hpp"

#include <algorithm>
#include <iterator>

namespace tokvec::build {

// =============================================================================
// NegativeReservoir
// =============================================================================

NegativeReservoir::NegativeReservoir(size_t capacity, std::mt19937_64& rng)
    : capacity_(capacity), rng_(rng) {
    pool_.reserve(capacity_);
}

void NegativeReservoir::offer(size_t record, size_t positives) {
    if (pool_.size() < capacity_ + positives) {
        pool_.push_back(record);
        return;
    }
    if (pool_.empty()) return;  // capacity 0 and no positives yet
    std::uniform_int_distribution<size_t> pick(0, pool_.size() - 1);
    pool_[pick(rng_)] = record;
}

// =============================================================================
// Dataset construction
// =============================================================================

std::optional<TokenDataset> build_token_dataset(uint32_t label,
                                                const std::vector<TokenIdSet>& corpus,
                                                size_t max_pos, size_t negative_cap,
                                                std::mt19937_64& rng) {
    TokenDataset dataset;
    NegativeReservoir reservoir(negative_cap, rng);

    for (size_t r = 0; r < corpus.size(); ++r) {
        const TokenIdSet& record = corpus[r];
        if (std::binary_search(record.begin(), record.end(), label)) {
            TokenIdSet example;
            example.reserve(record.size() - 1);
            std::copy_if(record.begin(), record.end(), std::back_inserter(example),
                         [label](uint32_t id) { return id != label; });
            dataset.positives.push_back(std::move(example));
        } else {
            reservoir.offer(r, dataset.positives.size());
        }
        if (dataset.positives.size() > max_pos) break;
    }

    if (dataset.positives.empty() || reservoir.empty()) {
        return std::nullopt;
    }

    std::vector<size_t> negatives = reservoir.records();
    std::shuffle(negatives.begin(), negatives.end(), rng);

    const size_t n = std::min(dataset.positives.size(), negatives.size());
    dataset.positives.resize(n);
    dataset.negatives.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        dataset.negatives.push_back(corpus[negatives[i]]);
    }
    return dataset;
}

SparseMatrix bag_of_tokens(const std::vector<TokenIdSet>& examples, size_t dimension) {
    std::vector<Eigen::Triplet<float>> triplets;
    size_t nnz = 0;
    for (const auto& example : examples) nnz += example.size();
    triplets.reserve(nnz);

    for (size_t row = 0; row < examples.size(); ++row) {
        for (uint32_t id : examples[row]) {
            if (id >= dimension) {
                throw InvalidArgumentError("Token id " + std::to_string(id) +
                                           " outside a vocabulary of " + std::to_string(dimension),
                                           __func__);
            }
            triplets.emplace_back(static_cast<int>(row), static_cast<int>(id), 1.0f);
        }
    }

    SparseMatrix X(static_cast<Eigen::Index>(examples.size()), static_cast<Eigen::Index>(dimension));
    // Duplicate ids collapse to a single indicator
    X.setFromTriplets(triplets.begin(), triplets.end(),
                      [](const float&, const float& b) { return b; });
    return X;
}

} // namespace tokvec::build
