#include "metrics/ratio.hpp"

namespace hcodec {

double compression_ratio(size_t original_symbols, size_t encoded_digits) {
    if (original_symbols == 0) return 0.0;
    const double original_bits = static_cast<double>(original_symbols) * static_cast<double>(kBitsPerSymbol);
    return static_cast<double>(encoded_digits) / original_bits * 100.0;
}

} // namespace hcodec
