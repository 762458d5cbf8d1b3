#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "model/frequency_model.hpp"

namespace hcodec {

// Marks an absent child. Only the right child of a single-symbol root.
inline constexpr int kNoChild = -1;

struct Leaf {
    Symbol symbol{0};
    uint64_t freq{0};
};

struct Internal {
    uint64_t freq{0};
    int left{kNoChild};  // arena index, see HuffTree::node()
    int right{kNoChild};
};

using TreeNode = std::variant<Leaf, Internal>;

uint64_t node_freq(const TreeNode& n);

// Huffman tree stored as an arena of nodes. The arena owns every node and
// each non-root node has exactly one parent. The constructor validates the
// structure and throws MalformedModelError on any violation, so a HuffTree
// in hand is always well formed.
class HuffTree {
public:
    HuffTree(std::vector<TreeNode> nodes, int root);

    int root() const { return root_; }
    const TreeNode& node(int idx) const;
    size_t size() const { return nodes_.size(); }

    // Root wraps the only leaf and has no right child.
    bool is_degenerate() const;
    uint64_t total_frequency() const;
    size_t leaf_count() const;

private:
    std::vector<TreeNode> nodes_;
    int root_{kNoChild};
};

// Throws MalformedModelError describing the first broken invariant.
void validate_tree(const std::vector<TreeNode>& nodes, int root);

// Same shape, symbols and frequencies. Arena layout may differ.
bool structurally_equal(const HuffTree& a, const HuffTree& b);

// Build a Huffman tree from a non-empty frequency model.
// Ties on frequency pop the subtree holding the smallest symbol first.
HuffTree build_huffman_tree(const FrequencyModel& model);

} // namespace hcodec
