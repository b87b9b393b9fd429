#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace tokvec::text {

/**
 * Half-open codepoint span [begin, end) with the label of the trie node the
 * match ended on.
 */
struct Span {
    size_t begin;
    size_t end;
    int32_t label;

    size_t length() const { return end - begin; }
};

/**
 * Character trie over Unicode codepoints.
 *
 * Nodes live in one arena and refer to their children by index. A node is
 * terminal when it carries a label (an index into the owner's label table).
 * The trie is built once and is read-only afterwards, so find_spans() may be
 * called concurrently.
 */
class CharTrie {
public:
    static constexpr uint32_t ROOT = 0;
    static constexpr uint32_t NONE = UINT32_MAX;
    static constexpr int32_t NO_LABEL = -1;

    CharTrie();

    // Sets the label of the node reached by key, creating the path as needed
    void insert(const std::vector<uint32_t>& key, int32_t label);

    // Label of the node reached by key, NO_LABEL when absent or not terminal
    int32_t find(const std::vector<uint32_t>& key) const;

    uint32_t child(uint32_t node, uint32_t cp) const;
    int32_t label(uint32_t node) const { return nodes_[node].label; }
    size_t node_count() const { return nodes_.size(); }

    /**
     * Greedy longest-match segmentation.
     *
     * Three cursors init <= end <= i walk the text once. A failed edge emits
     * the longest match found from init; when that match (or the unmatched
     * run) ends in the boundary marker, scanning restarts on the marker so
     * adjacent units share it. A mismatch on the first character skips it.
     */
    std::vector<Span> find_spans(const std::vector<uint32_t>& text) const;

private:
    struct Node {
        std::unordered_map<uint32_t, uint32_t> children;
        int32_t label = NO_LABEL;
    };

    std::vector<Node> nodes_;
};

} // namespace tokvec::text
