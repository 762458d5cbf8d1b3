#pragma once

#include <cstddef>

namespace hcodec {

// Baseline size of one original symbol.
inline constexpr size_t kBitsPerSymbol = 8;

// encoded_digits / (kBitsPerSymbol * original_symbols) * 100.
// Returns 0.0 when the original is empty.
double compression_ratio(size_t original_symbols, size_t encoded_digits);

} // namespace hcodec
