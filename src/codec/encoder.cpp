#include "codec/encoder.hpp"

#include "core/errors.hpp"

#include <cstdio>
#include <utility>

namespace hcodec {

std::string encode_symbols(const std::vector<Symbol>& symbols, const CodeTable& table) {
    std::string bits;
    for (size_t i = 0; i < symbols.size(); ++i) {
        auto it = table.find(symbols[i]);
        if (it == table.end()) {
            throw LookupFailureError("encode: symbol " + std::to_string(symbols[i]) +
                                     " at position " + std::to_string(i) + " not in code table");
        }
        bits += it->second;
    }
    return bits;
}

EncodeResult huff_encode(const std::vector<Symbol>& symbols) {
    EncodeResult result;
    if (symbols.empty()) {
        return result;
    }

    FrequencyModel freqs = build_frequency_model(symbols);
    HuffTree tree = build_huffman_tree(freqs);
    CodeTable table = build_code_table(tree);

    // Debug: print first used symbols with their codes
#ifndef NDEBUG
    std::fprintf(stderr, "Huffman table (first 10 symbols):\n");
    int count = 0;
    for (const auto& [sym, f] : sorted_frequencies(freqs)) {
        if (count++ >= 10) break;
        std::fprintf(stderr, "sym=%u freq=%llu code=%s\n",
                     sym, static_cast<unsigned long long>(f), table.at(sym).c_str());
    }
#endif

    result.bits = encode_symbols(symbols, table);
    result.tree = std::move(tree);
    return result;
}

EncodeResult huff_encode_text(const std::string& text) {
    return huff_encode(symbols_from_text(text));
}

} // namespace hcodec
