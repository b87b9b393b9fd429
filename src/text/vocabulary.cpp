#include "tokvec/text/vocabulary.hpp"
#include "tokvec/error.hpp"

#include <algorithm>
#include <cmath>

namespace tokvec::text {

Vocabulary::Vocabulary(TextModelParams params, Counter counter,
                       int size_exponent, SymbolTable symbols)
    : params_(std::move(params))
    , counter_(std::move(counter))
    , size_exponent_(size_exponent)
    , symbols_(std::move(symbols)) {
    const auto& items = counter_.items();
    names_.reserve(items.size());
    index_.reserve(items.size());
    idf_.resize(static_cast<Eigen::Index>(items.size()));

    const double N = static_cast<double>(counter_.update_calls());
    for (size_t i = 0; i < items.size(); ++i) {
        names_.push_back(items[i].first);
        index_.emplace(items[i].first, static_cast<uint32_t>(i));
        const double freq = static_cast<double>(items[i].second);
        idf_[static_cast<Eigen::Index>(i)] =
            (freq > 0 && N > 0) ? static_cast<float>(std::log2(N / freq)) : 0.0f;
    }

    if (size_exponent_ < 0) {
        size_exponent_ = 0;
        while ((size_t(1) << size_exponent_) < names_.size()) {
            ++size_exponent_;
        }
    } else if (size_exponent_ < 63 && names_.size() > (size_t(1) << size_exponent_)) {
        throw MalformedArtifactError("Vocabulary holds " + std::to_string(names_.size()) +
                                     " tokens, more than 2^" + std::to_string(size_exponent_), __func__);
    }
}

std::optional<uint32_t> Vocabulary::find(const std::string& token) const {
    auto it = index_.find(token);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

uint32_t Vocabulary::id(const std::string& token) const {
    auto it = index_.find(token);
    if (it == index_.end()) {
        throw InvalidArgumentError("Token '" + token + "' is not in the vocabulary", __func__);
    }
    return it->second;
}

std::string Vocabulary::identifier() const {
    return "seqtm_" + params_.lang + "_" + std::to_string(size_exponent_);
}

TokenIdSet Vocabulary::to_ids(const std::vector<std::string>& tokens) const {
    TokenIdSet ids;
    ids.reserve(tokens.size());
    for (const auto& token : tokens) {
        auto it = index_.find(token);
        if (it != index_.end()) ids.push_back(it->second);
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

} // namespace tokvec::text
