#include "tree/huffman_tree.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <limits>
#include <queue>
#include <string>
#include <unordered_set>
#include <utility>

namespace hcodec {

uint64_t node_freq(const TreeNode& n) {
    if (const auto* leaf = std::get_if<Leaf>(&n)) return leaf->freq;
    return std::get<Internal>(n).freq;
}

// ---------------- validation ---------------- //

void validate_tree(const std::vector<TreeNode>& nodes, int root) {
    if (nodes.empty()) {
        throw MalformedModelError("tree: no nodes");
    }
    if (nodes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw MalformedModelError("tree: too many nodes");
    }
    const int n = static_cast<int>(nodes.size());
    if (root < 0 || root >= n) {
        throw MalformedModelError("tree: root index out of range");
    }
    if (!std::holds_alternative<Internal>(nodes[root])) {
        throw MalformedModelError("tree: root must be an internal node");
    }

    std::vector<uint8_t> has_parent(nodes.size(), 0);
    std::unordered_set<Symbol> seen_symbols;
    size_t visited = 0;

    auto check_child = [&](int parent, int child, const char* side) {
        if (child < 0 || child >= n) {
            throw MalformedModelError("tree: node " + std::to_string(parent) + " has invalid " + side + " child");
        }
        if (child == root || has_parent[child]) {
            throw MalformedModelError("tree: node " + std::to_string(child) + " is shared or forms a cycle");
        }
        has_parent[child] = 1;
    };

    std::vector<int> stack;
    stack.push_back(root);
    while (!stack.empty()) {
        int idx = stack.back();
        stack.pop_back();
        ++visited;

        if (const auto* leaf = std::get_if<Leaf>(&nodes[idx])) {
            if (leaf->freq == 0) {
                throw MalformedModelError("tree: leaf " + std::to_string(idx) + " has zero frequency");
            }
            if (!seen_symbols.insert(leaf->symbol).second) {
                throw MalformedModelError("tree: symbol " + std::to_string(leaf->symbol) + " appears twice");
            }
            continue;
        }

        const Internal& in = std::get<Internal>(nodes[idx]);
        check_child(idx, in.left, "left");
        if (in.right == kNoChild) {
            // single-symbol wrapper: root -> one leaf
            if (idx != root || !std::holds_alternative<Leaf>(nodes[in.left])) {
                throw MalformedModelError("tree: internal node " + std::to_string(idx) + " is missing a child");
            }
            if (in.freq != node_freq(nodes[in.left])) {
                throw MalformedModelError("tree: frequency mismatch at root");
            }
            stack.push_back(in.left);
            continue;
        }
        check_child(idx, in.right, "right");

        uint64_t lf = node_freq(nodes[in.left]);
        uint64_t rf = node_freq(nodes[in.right]);
        if (lf > std::numeric_limits<uint64_t>::max() - rf || in.freq != lf + rf) {
            throw MalformedModelError("tree: frequency mismatch at node " + std::to_string(idx));
        }
        stack.push_back(in.right);
        stack.push_back(in.left);
    }

    if (visited != nodes.size()) {
        throw MalformedModelError("tree: unreachable nodes");
    }
}

// ---------------- HuffTree ---------------- //

HuffTree::HuffTree(std::vector<TreeNode> nodes, int root)
    : nodes_(std::move(nodes)), root_(root) {
    validate_tree(nodes_, root_);
}

const TreeNode& HuffTree::node(int idx) const {
    if (idx < 0 || static_cast<size_t>(idx) >= nodes_.size()) {
        throw std::out_of_range("tree: node index out of range");
    }
    return nodes_[static_cast<size_t>(idx)];
}

bool HuffTree::is_degenerate() const {
    return std::get<Internal>(nodes_[root_]).right == kNoChild;
}

uint64_t HuffTree::total_frequency() const {
    return node_freq(nodes_[root_]);
}

size_t HuffTree::leaf_count() const {
    size_t count = 0;
    for (const auto& n : nodes_) {
        if (std::holds_alternative<Leaf>(n)) ++count;
    }
    return count;
}

bool structurally_equal(const HuffTree& a, const HuffTree& b) {
    if (a.size() != b.size()) return false;
    std::vector<std::pair<int, int>> stack;
    stack.push_back({a.root(), b.root()});
    while (!stack.empty()) {
        auto [ia, ib] = stack.back();
        stack.pop_back();
        if (ia == kNoChild || ib == kNoChild) {
            if (ia != ib) return false;
            continue;
        }
        const TreeNode& na = a.node(ia);
        const TreeNode& nb = b.node(ib);
        if (na.index() != nb.index()) return false;
        if (const auto* la = std::get_if<Leaf>(&na)) {
            const Leaf& lb = std::get<Leaf>(nb);
            if (la->symbol != lb.symbol || la->freq != lb.freq) return false;
            continue;
        }
        const Internal& xa = std::get<Internal>(na);
        const Internal& xb = std::get<Internal>(nb);
        if (xa.freq != xb.freq) return false;
        stack.push_back({xa.right, xb.right});
        stack.push_back({xa.left, xb.left});
    }
    return true;
}

// ---------------- builder ---------------- //

namespace {

struct HeapNode {
    uint64_t freq;
    Symbol symbol; // smallest symbol in subtree, for tie-break
    int index;     // into arena
};

struct HeapComp {
    bool operator()(const HeapNode& a, const HeapNode& b) const {
        if (a.freq != b.freq) return a.freq > b.freq; // min-heap
        return a.symbol > b.symbol; // tie-break by smallest symbol
    }
};

} // namespace

HuffTree build_huffman_tree(const FrequencyModel& model) {
    if (model.empty()) {
        throw InvalidInputError("huffman: empty frequency model");
    }
    const auto sym_freq = sorted_frequencies(model);

    std::vector<TreeNode> nodes;
    nodes.reserve(sym_freq.size() * 2);
    std::priority_queue<HeapNode, std::vector<HeapNode>, HeapComp> pq;

    for (const auto& [sym, f] : sym_freq) {
        if (f == 0) {
            throw InvalidInputError("huffman: symbol " + std::to_string(sym) + " has zero frequency");
        }
        pq.push({f, sym, static_cast<int>(nodes.size())});
        nodes.emplace_back(Leaf{sym, f});
    }

    // Edge case: only one symbol. Wrap it so its code is "0".
    if (pq.size() == 1) {
        HeapNode only = pq.top();
        int root = static_cast<int>(nodes.size());
        nodes.emplace_back(Internal{only.freq, only.index, kNoChild});
        return HuffTree(std::move(nodes), root);
    }

    while (pq.size() > 1) {
        HeapNode a = pq.top(); pq.pop();
        HeapNode b = pq.top(); pq.pop();
        if (a.freq > std::numeric_limits<uint64_t>::max() - b.freq) {
            throw InvalidInputError("huffman: frequency overflow");
        }
        HeapNode parent{a.freq + b.freq, std::min(a.symbol, b.symbol), static_cast<int>(nodes.size())};
        nodes.emplace_back(Internal{parent.freq, a.index, b.index});
        pq.push(parent);
    }

#ifndef NDEBUG
    std::fprintf(stderr, "huffman: built tree with %zu leaves, %zu nodes\n",
                 sym_freq.size(), nodes.size());
#endif
    int root = pq.top().index;
    return HuffTree(std::move(nodes), root);
}

} // namespace hcodec
