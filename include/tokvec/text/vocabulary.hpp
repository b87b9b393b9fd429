#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tokvec/text/counter.hpp"
#include "tokvec/text/normalizer.hpp"
#include "tokvec/types.hpp"

namespace tokvec::text {

// Surface form -> canonical token (e.g. emoji aliases)
using SymbolTable = std::vector<std::pair<std::string, std::string>>;

/**
 * Fixed sub-word vocabulary.
 *
 * Ids are dense and follow the insertion order of the counter the
 * vocabulary is built from. Each token carries its corpus frequency and an
 * IDF weight log2(update_calls / frequency).
 */
class Vocabulary {
public:
    /**
     * @param params        Base text model the tokens were produced with
     * @param counter       Token frequencies and the record count
     * @param size_exponent Budget exponent; -1 derives the smallest k with 2^k >= size
     * @param symbols       Extra surface forms resolved to canonical tokens
     */
    Vocabulary(TextModelParams params, Counter counter,
               int size_exponent = -1, SymbolTable symbols = {});

    size_t size() const { return names_.size(); }

    std::optional<uint32_t> find(const std::string& token) const;
    bool contains(const std::string& token) const { return index_.count(token) > 0; }

    // Throws InvalidArgumentError for unknown tokens
    uint32_t id(const std::string& token) const;

    const std::string& name(uint32_t id) const { return names_[id]; }
    const std::vector<std::string>& names() const { return names_; }

    int64_t frequency(uint32_t id) const { return counter_.items()[id].second; }
    const Vector& idf() const { return idf_; }

    // "seqtm_<lang>_<size_exponent>"
    std::string identifier() const;

    // Sorted, de-duplicated ids of tokens; unknown tokens are dropped
    TokenIdSet to_ids(const std::vector<std::string>& tokens) const;

    const TextModelParams& params() const { return params_; }
    const Counter& counter() const { return counter_; }
    const SymbolTable& symbols() const { return symbols_; }
    int size_exponent() const { return size_exponent_; }

private:
    TextModelParams params_;
    Counter counter_;
    int size_exponent_;
    SymbolTable symbols_;

    std::vector<std::string> names_;
    std::unordered_map<std::string, uint32_t> index_;
    Vector idf_;
};

} // namespace tokvec::text
