#pragma once

#include <optional>
#include <string>
#include <vector>

#include "entropy/code_table.hpp"
#include "model/frequency_model.hpp"
#include "tree/huffman_tree.hpp"

namespace hcodec {

struct EncodeResult {
    std::string bits;              // '0'/'1' digits
    std::optional<HuffTree> tree;  // absent for empty input
};

// Concatenate each symbol's code in input order.
// Throws LookupFailureError if a symbol has no code.
std::string encode_symbols(const std::vector<Symbol>& symbols, const CodeTable& table);

// Full pipeline: frequencies -> tree -> code table -> digits.
// Empty input gives empty digits and no tree.
EncodeResult huff_encode(const std::vector<Symbol>& symbols);
EncodeResult huff_encode_text(const std::string& text);

} // namespace hcodec
