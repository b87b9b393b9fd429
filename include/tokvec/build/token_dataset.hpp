#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <vector>

#include "tokvec/types.hpp"

namespace tokvec::build {

/**
 * Bounded pool of negative record indices.
 *
 * A record is appended while the pool holds fewer than capacity + positives
 * entries; otherwise it replaces a uniformly chosen entry. Memory stays
 * O(capacity + positives) however long the stream is.
 */
class NegativeReservoir {
public:
    NegativeReservoir(size_t capacity, std::mt19937_64& rng);

    void offer(size_t record, size_t positives);

    const std::vector<size_t>& records() const { return pool_; }
    size_t size() const { return pool_.size(); }
    bool empty() const { return pool_.empty(); }

private:
    size_t capacity_;
    std::mt19937_64& rng_;
    std::vector<size_t> pool_;
};

/**
 * Balanced examples for one label token. Positives are the records holding
 * the label, with the label removed; both classes have the same size.
 */
struct TokenDataset {
    std::vector<TokenIdSet> positives;
    std::vector<TokenIdSet> negatives;

    size_t size() const { return positives.size() + negatives.size(); }
};

/**
 * Scans the corpus once in order. Scanning stops as soon as more than
 * max_pos positives were collected. Returns nullopt when either class ends
 * up empty.
 */
std::optional<TokenDataset> build_token_dataset(uint32_t label,
                                                const std::vector<TokenIdSet>& corpus,
                                                size_t max_pos, size_t negative_cap,
                                                std::mt19937_64& rng);

// Maps token-id sets to classifier rows over a vocabulary of `dimension` tokens
using FeatureProjection =
    std::function<SparseMatrix(const std::vector<TokenIdSet>& examples, size_t dimension)>;

// Indicator bag: 1 at every token of the example
SparseMatrix bag_of_tokens(const std::vector<TokenIdSet>& examples, size_t dimension);

} // namespace tokvec::build
