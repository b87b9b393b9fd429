#include "tokvec/text/counter.hpp"

#include <algorithm>
#include <numeric>

namespace tokvec::text {

Counter::Counter(std::vector<Entry> entries, uint64_t update_calls)
    : update_calls_(update_calls) {
    entries_.reserve(entries.size());
    for (auto& [token, count] : entries) {
        auto it = index_.find(token);
        if (it != index_.end()) {
            entries_[it->second].second = count;
            continue;
        }
        index_.emplace(token, entries_.size());
        entries_.emplace_back(std::move(token), count);
    }
}

void Counter::update(const std::vector<std::string>& tokens) {
    for (const auto& token : tokens) {
        add(token, 1);
    }
    ++update_calls_;
}

void Counter::add(const std::string& token, int64_t n) {
    auto it = index_.find(token);
    if (it != index_.end()) {
        entries_[it->second].second += n;
        return;
    }
    index_.emplace(token, entries_.size());
    entries_.emplace_back(token, n);
}

void Counter::set(const std::string& token, int64_t n) {
    auto it = index_.find(token);
    if (it != index_.end()) {
        entries_[it->second].second = n;
        return;
    }
    index_.emplace(token, entries_.size());
    entries_.emplace_back(token, n);
}

int64_t Counter::get(const std::string& token) const {
    auto it = index_.find(token);
    return it == index_.end() ? 0 : entries_[it->second].second;
}

std::vector<Counter::Entry> Counter::most_common(size_t n) const {
    std::vector<size_t> order(entries_.size());
    std::iota(order.begin(), order.end(), size_t(0));
    std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
        return entries_[a].second > entries_[b].second;
    });

    const size_t keep = std::min(n, order.size());
    std::vector<Entry> result;
    result.reserve(keep);
    for (size_t i = 0; i < keep; ++i) {
        result.push_back(entries_[order[i]]);
    }
    return result;
}

} // namespace tokvec::text
