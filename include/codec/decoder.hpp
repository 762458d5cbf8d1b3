#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model/frequency_model.hpp"
#include "tree/huffman_tree.hpp"

namespace hcodec {

// Walk the tree from the root for each digit; emit a symbol at every leaf.
// Throws InvalidInputError on a non-binary digit or a stream that ends
// mid-code. A single-symbol tree decodes one symbol per digit.
std::vector<Symbol> huff_decode(const std::string& bits, const HuffTree& tree);

// Empty digits decode to nothing with or without a tree.
std::vector<Symbol> huff_decode(const std::string& bits, const std::optional<HuffTree>& tree);

std::string huff_decode_text(const std::string& bits, const std::optional<HuffTree>& tree);

} // namespace hcodec
