#include "entropy/code_table.hpp"

#include "core/errors.hpp"

#include <utility>
#include <vector>

namespace hcodec {

CodeTable build_code_table(const HuffTree& tree) {
    CodeTable table;
    table.reserve(tree.leaf_count());

    std::vector<std::pair<int, std::string>> stack; // (node index, path)
    stack.push_back({tree.root(), std::string()});

    while (!stack.empty()) {
        auto [idx, path] = std::move(stack.back());
        stack.pop_back();

        const TreeNode& n = tree.node(idx);
        if (const auto* leaf = std::get_if<Leaf>(&n)) {
            // the root is always internal, so every path is non-empty
            if (path.empty()) {
                throw MalformedModelError("code table: leaf reached with empty code");
            }
            table.emplace(leaf->symbol, std::move(path));
            continue;
        }
        const Internal& in = std::get<Internal>(n);
        // push right then left so left is processed first
        if (in.right != kNoChild) stack.push_back({in.right, path + '1'});
        stack.push_back({in.left, path + '0'});
    }
    return table;
}

std::unordered_map<Symbol, size_t> code_lengths(const CodeTable& table) {
    std::unordered_map<Symbol, size_t> lens;
    lens.reserve(table.size());
    for (const auto& [sym, code] : table) {
        lens.emplace(sym, code.size());
    }
    return lens;
}

} // namespace hcodec
