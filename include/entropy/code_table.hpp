#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

#include "model/frequency_model.hpp"
#include "tree/huffman_tree.hpp"

namespace hcodec {

// symbol -> digit code ('0' = left, '1' = right), prefix-free
using CodeTable = std::unordered_map<Symbol, std::string>;

// Depth-first walk from the root. A single-symbol tree yields "0".
CodeTable build_code_table(const HuffTree& tree);

// symbol -> code length in digits
std::unordered_map<Symbol, size_t> code_lengths(const CodeTable& table);

} // namespace hcodec
