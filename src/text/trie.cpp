#include "tokvec/text/trie.hpp"
#include "tokvec/text/normalizer.hpp"

namespace tokvec::text {

CharTrie::CharTrie() {
    nodes_.emplace_back();
}

void CharTrie::insert(const std::vector<uint32_t>& key, int32_t label) {
    uint32_t node = ROOT;
    for (uint32_t cp : key) {
        auto it = nodes_[node].children.find(cp);
        if (it != nodes_[node].children.end()) {
            node = it->second;
            continue;
        }
        const uint32_t next = static_cast<uint32_t>(nodes_.size());
        nodes_[node].children.emplace(cp, next);
        nodes_.emplace_back();
        node = next;
    }
    nodes_[node].label = label;
}

uint32_t CharTrie::child(uint32_t node, uint32_t cp) const {
    const auto& children = nodes_[node].children;
    auto it = children.find(cp);
    return it == children.end() ? NONE : it->second;
}

int32_t CharTrie::find(const std::vector<uint32_t>& key) const {
    uint32_t node = ROOT;
    for (uint32_t cp : key) {
        node = child(node, cp);
        if (node == NONE) return NO_LABEL;
    }
    return nodes_[node].label;
}

std::vector<Span> CharTrie::find_spans(const std::vector<uint32_t>& text) const {
    constexpr uint32_t MARKER = static_cast<uint32_t>(BOUNDARY);

    std::vector<Span> spans;
    const size_t n = text.size();
    size_t init = 0, i = 0, end = 0;
    uint32_t node = ROOT;
    int32_t match_label = NO_LABEL;

    while (i < n) {
        const uint32_t next = child(node, text[i]);
        if (next != NONE) {
            node = next;
            ++i;
            if (nodes_[node].label != NO_LABEL) {
                end = i;
                match_label = nodes_[node].label;
            }
            continue;
        }

        node = ROOT;
        if (end > init) {
            spans.push_back({init, end, match_label});
            if (end - init >= 2 && text[end - 1] == MARKER) {
                init = i = end = end - 1;
            } else {
                init = i = end;
            }
        } else if (i > init) {
            if (i - init >= 2 && text[i - 1] == MARKER) {
                init = end = i = i - 1;
            } else {
                init = end = i;
            }
        } else {
            ++init;
            i = end = init;
        }
        match_label = NO_LABEL;
    }

    if (end > init) {
        spans.push_back({init, end, match_label});
    }
    return spans;
}

} // namespace tokvec::text
