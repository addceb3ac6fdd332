#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "textutil.hpp"

namespace citysuggest {

namespace detail {

// Absent-value checks for the pointer-like value types the tree accepts.
template <typename T>
bool is_absent(const T&) { return false; }

template <typename T>
bool is_absent(T* const& p) { return p == nullptr; }

template <typename T>
bool is_absent(const std::shared_ptr<T>& p) { return !p; }

template <typename T>
bool is_absent(const std::optional<T>& o) { return !o.has_value(); }

} // namespace detail

// Compressed prefix tree (radix tree) keyed by normalized strings.
//
// Notes:
// - Keys go through normalize_key(): letters are lowercased, everything else
//   becomes the separator, separators are trimmed from both ends.
// - Each node owns a key segment; concatenating segments from the root gives
//   the full key. The root segment is always empty.
// - Several values may share a key; a (key, value) pair is stored once.
//   Value identity is decided by Equal.
// - Nodes live in an arena and link to each other by index. Children are a
//   sparse map from slot (0 = separator, 1..26 = a..z) to node index.
// - No internal locking: mutation needs exclusive access, concurrent reads
//   are fine when nothing mutates.
template <typename V, typename Equal = std::equal_to<V>>
class RadixTree {
public:
    RadixTree() { clear(); }

    explicit RadixTree(Equal eq) : eq_(std::move(eq)) { clear(); }

    // Store value under key. Returns false if the pair was already present.
    // Throws InvalidValue for an absent value, InvalidKey if the normalized
    // key cannot be placed in the tree.
    bool add(const std::string& key, const V& value) {
        if (detail::is_absent(value)) throw InvalidValue("radix tree: absent value");

        std::string rest = normalize_key(key);
        uint32_t cur = ROOT;

        for (;;) {
            const std::string& seg = nodes_[cur].segment;

            if (rest == seg) return add_value(cur, value);

            if (starts_with(rest, seg)) {
                rest.erase(0, seg.size());
                cur = child_or_create(cur, rest);
            } else {
                cur = split(cur, common_prefix(seg, rest));
            }
        }
    }

    // Values whose key starts with key, in depth-first slot order.
    // Returns an empty list when nothing matches.
    std::vector<V> get_all(const std::string& key) const {
        std::vector<V> out;
        uint32_t node = find_partial(normalize_key(key));
        if (node != NONE) collect(node, out);
        return out;
    }

    // True if value is stored under exactly this key (a prefix is not enough).
    bool contains(const std::string& key, const V& value) const {
        uint32_t node = find_exact(normalize_key(key));
        if (node == NONE) return false;
        return index_of(nodes_[node].values, value) >= 0;
    }

    // Remove value from the node reached by prefix matching on key, then
    // merge or detach nodes left without values.
    bool remove(const std::string& key, const V& value) {
        uint32_t node = find_partial(normalize_key(key));
        if (node == NONE) return false;

        auto& vals = nodes_[node].values;
        int idx = index_of(vals, value);
        if (idx < 0) return false;

        vals.erase(vals.begin() + idx);
        value_count_--;
        try_merge(node);
        return true;
    }

    // Snapshot of every value in alphabetical order (separator first, then
    // a..z at each level, a node's own values before its children).
    std::vector<V> values() const {
        std::vector<V> out;
        out.reserve(value_count_);
        collect(ROOT, out);
        return out;
    }

    // Node segments in the same depth-first order, root ("") first.
    std::vector<std::string> segments() const {
        std::vector<std::string> out;
        collect_segments(ROOT, out);
        return out;
    }

    size_t size() const { return value_count_; }
    bool empty() const { return value_count_ == 0; }

    // Live nodes, root included.
    size_t node_count() const { return nodes_.size() - free_.size(); }

    void clear() {
        nodes_.clear();
        free_.clear();
        nodes_.push_back(Node{});
        value_count_ = 0;
    }

private:
    static constexpr uint32_t ROOT = 0;
    static constexpr uint32_t NONE = UINT32_MAX;

    struct Node {
        std::string segment;
        std::vector<V> values;
        std::map<int, uint32_t> children;
        uint32_t parent = NONE;
    };

    std::vector<Node> nodes_;
    std::vector<uint32_t> free_;
    size_t value_count_ = 0;
    Equal eq_;

    static int slot_of(const std::string& segment) {
        int slot = segment.empty() ? -1 : key_slot(segment[0]);
        if (slot < 0) throw InvalidKey("radix tree: no child slot for segment \"" + segment + "\"");
        return slot;
    }

    static size_t common_prefix(const std::string& a, const std::string& b) {
        size_t i = 0;
        while (i < a.size() && i < b.size() && a[i] == b[i]) i++;
        return i;
    }

    int index_of(const std::vector<V>& vals, const V& value) const {
        for (size_t i = 0; i < vals.size(); i++) {
            if (eq_(vals[i], value)) return (int)i;
        }
        return -1;
    }

    bool add_value(uint32_t node, const V& value) {
        auto& vals = nodes_[node].values;
        if (index_of(vals, value) >= 0) return false;
        vals.push_back(value);
        value_count_++;
        return true;
    }

    uint32_t alloc_node(const std::string& segment, uint32_t parent) {
        uint32_t id;
        if (!free_.empty()) {
            id = free_.back();
            free_.pop_back();
        } else {
            id = (uint32_t)nodes_.size();
            nodes_.push_back(Node{});
        }
        nodes_[id].segment = segment;
        nodes_[id].parent = parent;
        return id;
    }

    void free_node(uint32_t id) {
        nodes_[id] = Node{};
        free_.push_back(id);
    }

    uint32_t find_child(uint32_t node, const std::string& rest) const {
        const auto& kids = nodes_[node].children;
        auto it = kids.find(slot_of(rest));
        return it == kids.end() ? NONE : it->second;
    }

    // Child of node for the first character of rest; created with rest as its
    // whole segment if the slot is empty.
    uint32_t child_or_create(uint32_t node, const std::string& rest) {
        int slot = slot_of(rest);
        auto it = nodes_[node].children.find(slot);
        if (it != nodes_[node].children.end()) return it->second;

        uint32_t child = alloc_node(rest, node);
        nodes_[node].children.emplace(slot, child);
        return child;
    }

    // Cut node's segment after `length` characters. A new node takes the
    // leading part and node's place in its parent; node keeps the remainder
    // and hangs below it. Returns the new node.
    uint32_t split(uint32_t node, size_t length) {
        if (node == ROOT || length == 0 || length >= nodes_[node].segment.size()) {
            throw InvalidKey("radix tree: impossible split of \"" + nodes_[node].segment + "\"");
        }

        std::string head = nodes_[node].segment.substr(0, length);
        std::string tail = nodes_[node].segment.substr(length);
        uint32_t parent = nodes_[node].parent;

        uint32_t mid = alloc_node(head, parent);
        nodes_[parent].children[slot_of(head)] = mid;

        nodes_[node].segment = tail;
        nodes_[node].parent = mid;
        nodes_[mid].children.emplace(slot_of(tail), node);
        return mid;
    }

    // Node whose key equals rest or starts with it.
    uint32_t find_partial(std::string rest) const {
        uint32_t cur = ROOT;
        for (;;) {
            const std::string& seg = nodes_[cur].segment;
            if (starts_with(seg, rest)) return cur;
            if (!starts_with(rest, seg)) return NONE;

            rest.erase(0, seg.size());
            cur = find_child(cur, rest);
            if (cur == NONE) return NONE;
        }
    }

    // Node whose key equals rest.
    uint32_t find_exact(std::string rest) const {
        uint32_t cur = ROOT;
        for (;;) {
            const std::string& seg = nodes_[cur].segment;
            if (rest == seg) return cur;
            if (!starts_with(rest, seg)) return NONE;

            rest.erase(0, seg.size());
            cur = find_child(cur, rest);
            if (cur == NONE) return NONE;
        }
    }

    // Restore the no-redundant-node invariant after a value left `node`.
    // The root is never merged or detached.
    void try_merge(uint32_t node) {
        while (node != ROOT && nodes_[node].values.empty()) {
            auto& kids = nodes_[node].children;

            if (kids.size() == 1) {
                merge_into_child(node);
                return;
            }
            if (!kids.empty()) return;

            uint32_t parent = nodes_[node].parent;
            nodes_[parent].children.erase(slot_of(nodes_[node].segment));
            free_node(node);
            node = parent;
        }
    }

    // The only child absorbs node's segment and takes its slot in the parent.
    void merge_into_child(uint32_t node) {
        uint32_t child = nodes_[node].children.begin()->second;
        uint32_t parent = nodes_[node].parent;

        nodes_[child].segment = nodes_[node].segment + nodes_[child].segment;
        nodes_[child].parent = parent;
        nodes_[parent].children[slot_of(nodes_[child].segment)] = child;
        free_node(node);
    }

    void collect(uint32_t node, std::vector<V>& out) const {
        const Node& n = nodes_[node];
        out.insert(out.end(), n.values.begin(), n.values.end());
        for (const auto& kv : n.children) collect(kv.second, out);
    }

    void collect_segments(uint32_t node, std::vector<std::string>& out) const {
        out.push_back(nodes_[node].segment);
        for (const auto& kv : nodes_[node].children) collect_segments(kv.second, out);
    }
};

} // namespace citysuggest
