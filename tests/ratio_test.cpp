#include "metrics/ratio.hpp"

#include "codec/encoder.hpp"

#include <gtest/gtest.h>

using namespace hcodec;

TEST(Ratio, SingleSymbolInput) {
    EncodeResult r = huff_encode_text("aaaaa");
    EXPECT_DOUBLE_EQ(compression_ratio(5, r.bits.size()), 12.5);
}

TEST(Ratio, EmptyInputIsZero) {
    EXPECT_DOUBLE_EQ(compression_ratio(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(compression_ratio(0, 17), 0.0);
}

TEST(Ratio, EightDigitsPerSymbolIsOneHundredPercent) {
    EXPECT_DOUBLE_EQ(compression_ratio(3, 24), 100.0);
}

TEST(Ratio, UniformAlphabet) {
    // 6 codes of 4 digits + 20 of 5 = 124 digits over 208 bits
    EncodeResult r = huff_encode_text("abcdefghijklmnopqrstuvwxyz");
    EXPECT_EQ(r.bits.size(), 124u);
    EXPECT_DOUBLE_EQ(compression_ratio(26, r.bits.size()), 124.0 / 208.0 * 100.0);
}
