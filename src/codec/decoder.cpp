#include "codec/decoder.hpp"

#include "codec/encoder.hpp"
#include "core/errors.hpp"

#include <stdexcept>

namespace hcodec {

namespace {

[[noreturn]] void bad_digit(const std::string& bits, size_t pos) {
    throw InvalidInputError("decode: invalid digit (char code " +
                            std::to_string(static_cast<unsigned char>(bits[pos])) +
                            ") at position " + std::to_string(pos));
}

} // namespace

std::vector<Symbol> huff_decode(const std::string& bits, const HuffTree& tree) {
    std::vector<Symbol> out;
    if (bits.empty()) {
        return out;
    }

    const int root = tree.root();
    const Internal& root_node = std::get<Internal>(tree.node(root));

    // Single symbol: every digit is a placeholder for it.
    if (tree.is_degenerate()) {
        const Symbol sym = std::get<Leaf>(tree.node(root_node.left)).symbol;
        for (size_t i = 0; i < bits.size(); ++i) {
            if (bits[i] != '0' && bits[i] != '1') bad_digit(bits, i);
        }
        out.assign(bits.size(), sym);
        return out;
    }

    int node = root;
    for (size_t i = 0; i < bits.size(); ++i) {
        const Internal& in = std::get<Internal>(tree.node(node));
        if (bits[i] == '0') {
            node = in.left;
        } else if (bits[i] == '1') {
            node = in.right;
        } else {
            bad_digit(bits, i);
        }
        if (const auto* leaf = std::get_if<Leaf>(&tree.node(node))) {
            out.push_back(leaf->symbol);
            node = root;
        }
    }
    if (node != root) {
        throw InvalidInputError("decode: stream ends in the middle of a code");
    }
    return out;
}

std::vector<Symbol> huff_decode(const std::string& bits, const std::optional<HuffTree>& tree) {
    if (bits.empty()) {
        return {};
    }
    if (!tree) {
        throw InvalidInputError("decode: non-empty stream without a tree");
    }
    return huff_decode(bits, *tree);
}

std::string huff_decode_text(const std::string& bits, const std::optional<HuffTree>& tree) {
    return text_from_symbols(huff_decode(bits, tree));
}

#ifndef NDEBUG
namespace {
// Minimal self-test: encode, decode, compare. Covers the single-symbol wrapper too.
struct HuffmanSelfTest {
    HuffmanSelfTest() {
        const std::vector<std::vector<Symbol>> inputs = {
            {3, 0, 1, 3, 2, 2, 3},
            {7, 7, 7},
        };
        for (const auto& symbols : inputs) {
            EncodeResult encoded = huff_encode(symbols);
            if (!encoded.tree || huff_decode(encoded.bits, *encoded.tree) != symbols) {
                throw std::runtime_error("huffman self-test: round-trip mismatch");
            }
        }
    }
};
static HuffmanSelfTest _huff_self_test{};
} // namespace
#endif

} // namespace hcodec
