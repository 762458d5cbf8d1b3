#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hcodec {

// Opaque symbol id. Text maps one byte to one symbol.
using Symbol = uint32_t;

// symbol -> occurrence count (every count >= 1)
using FrequencyModel = std::unordered_map<Symbol, uint64_t>;

// Tally occurrences of each distinct symbol. Empty input gives an empty model.
FrequencyModel build_frequency_model(const std::vector<Symbol>& symbols);

// (symbol, count) pairs sorted by symbol.
std::vector<std::pair<Symbol, uint64_t>> sorted_frequencies(const FrequencyModel& model);

// Sum of all counts; equals the input length the model was built from.
uint64_t total_count(const FrequencyModel& model);

std::vector<Symbol> symbols_from_text(const std::string& text);
std::string text_from_symbols(const std::vector<Symbol>& symbols);

} // namespace hcodec
