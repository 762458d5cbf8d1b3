#include "model/frequency_model.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <limits>

namespace hcodec {

FrequencyModel build_frequency_model(const std::vector<Symbol>& symbols) {
    FrequencyModel freq_map;
    for (Symbol s : symbols) {
        ++freq_map[s];
    }
    return freq_map;
}

std::vector<std::pair<Symbol, uint64_t>> sorted_frequencies(const FrequencyModel& model) {
    std::vector<std::pair<Symbol, uint64_t>> sym_freq(model.begin(), model.end());
    std::sort(sym_freq.begin(), sym_freq.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return sym_freq;
}

uint64_t total_count(const FrequencyModel& model) {
    uint64_t total = 0;
    for (const auto& kv : model) {
        if (kv.second > std::numeric_limits<uint64_t>::max() - total) {
            throw InvalidInputError("frequency: total count overflow");
        }
        total += kv.second;
    }
    return total;
}

std::vector<Symbol> symbols_from_text(const std::string& text) {
    std::vector<Symbol> symbols;
    symbols.reserve(text.size());
    for (char c : text) {
        symbols.push_back(static_cast<Symbol>(static_cast<unsigned char>(c)));
    }
    return symbols;
}

std::string text_from_symbols(const std::vector<Symbol>& symbols) {
    std::string text;
    text.reserve(symbols.size());
    for (Symbol s : symbols) {
        if (s > 0xFFu) {
            throw InvalidInputError("text: symbol " + std::to_string(s) + " is not a byte");
        }
        text.push_back(static_cast<char>(static_cast<unsigned char>(s)));
    }
    return text;
}

} // namespace hcodec
