#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tokvec::text {

/**
 * Insertion-ordered frequency table.
 *
 * update_calls counts the records that contributed through update(); it is
 * the N of the IDF weights computed from the table.
 */
class Counter {
public:
    using Entry = std::pair<std::string, int64_t>;

    Counter() = default;
    Counter(std::vector<Entry> entries, uint64_t update_calls);

    // +1 for every token occurrence; one update call
    void update(const std::vector<std::string>& tokens);

    // Adds n to token (inserted at the end when new)
    void add(const std::string& token, int64_t n);

    // Replaces the count of token, keeping its position
    void set(const std::string& token, int64_t n);

    int64_t get(const std::string& token) const;
    bool contains(const std::string& token) const { return index_.count(token) > 0; }

    // Highest counts first; ties keep first-insertion order
    std::vector<Entry> most_common(size_t n = std::numeric_limits<size_t>::max()) const;

    const std::vector<Entry>& items() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    uint64_t update_calls() const { return update_calls_; }
    void set_update_calls(uint64_t n) { update_calls_ = n; }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
    uint64_t update_calls_ = 0;
};

} // namespace tokvec::text
