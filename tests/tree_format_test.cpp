#include "format/tree_format.hpp"

#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "core/errors.hpp"
#include "entropy/bitstream.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace hcodec;

namespace {

// Wrap a hand-written payload in a valid v1 header.
std::vector<uint8_t> make_blob(const std::vector<uint8_t>& payload, uint32_t node_count) {
    ByteWriter w;
    w.write_bytes("HUFT", 4);
    w.write_u16_le(kTreeFormatVersion);
    w.write_u16_le(kTreeHeaderBytes);
    w.write_u32_le(node_count);
    w.write_u32_le(static_cast<uint32_t>(payload.size()));
    w.write_u32_le(crc32(payload.data(), payload.size()));
    w.write_bytes(payload.data(), payload.size());
    return w.release();
}

void put_leaf(ByteWriter& w, Symbol s, uint64_t f) {
    w.write_u8(kTagLeaf);
    w.write_u32_le(s);
    w.write_u64_le(f);
}

void put_internal(ByteWriter& w, uint64_t f) {
    w.write_u8(kTagInternal);
    w.write_u64_le(f);
}

} // namespace

TEST(TreeFormat, Crc32MatchesReferenceValue) {
    const std::string s = "123456789";
    EXPECT_EQ(crc32(reinterpret_cast<const uint8_t*>(s.data()), s.size()), 0xCBF43926u);
}

TEST(TreeFormat, RoundTripPreservesDecoding) {
    const std::string text = "the quick brown fox jumps over the lazy dog";
    EncodeResult r = huff_encode_text(text);
    ASSERT_TRUE(r.tree.has_value());

    HuffTree loaded = deserialize_tree(serialize_tree(*r.tree));
    EXPECT_TRUE(structurally_equal(loaded, *r.tree));
    EXPECT_EQ(huff_decode(r.bits, loaded), huff_decode(r.bits, *r.tree));
    EXPECT_EQ(huff_decode_text(r.bits, loaded), text);
}

TEST(TreeFormat, RoundTripSingleSymbolTree) {
    EncodeResult r = huff_encode_text("aaaaa");
    ASSERT_TRUE(r.tree.has_value());
    HuffTree loaded = deserialize_tree(serialize_tree(*r.tree));
    EXPECT_TRUE(loaded.is_degenerate());
    EXPECT_EQ(huff_decode_text(r.bits, loaded), "aaaaa");
}

TEST(TreeFormat, HeaderFields) {
    EncodeResult r = huff_encode_text("abracadabra");
    ASSERT_TRUE(r.tree.has_value());
    std::vector<uint8_t> bytes = serialize_tree(*r.tree);

    TreeFileHeader hdr = read_tree_header(bytes);
    EXPECT_EQ(std::string(hdr.magic, 4), "HUFT");
    EXPECT_EQ(hdr.version, 1u);
    EXPECT_EQ(hdr.header_bytes, kTreeHeaderBytes);
    EXPECT_EQ(hdr.node_count, r.tree->size());
    EXPECT_EQ(hdr.payload_bytes, bytes.size() - kTreeHeaderBytes);
    // pre-order starts with the internal root
    EXPECT_EQ(bytes[kTreeHeaderBytes], kTagInternal);
}

TEST(TreeFormat, RejectsBadMagic) {
    std::vector<uint8_t> bytes = serialize_tree(*huff_encode_text("abc").tree);
    bytes[0] = 'X';
    EXPECT_THROW(deserialize_tree(bytes), MalformedModelError);
}

TEST(TreeFormat, RejectsUnsupportedVersion) {
    std::vector<uint8_t> bytes = serialize_tree(*huff_encode_text("abc").tree);
    bytes[4] = 2;
    EXPECT_THROW(deserialize_tree(bytes), MalformedModelError);
}

TEST(TreeFormat, RejectsTruncatedData) {
    std::vector<uint8_t> bytes = serialize_tree(*huff_encode_text("abc").tree);
    EXPECT_THROW(deserialize_tree(std::vector<uint8_t>(bytes.begin(), bytes.begin() + 10)), MalformedModelError);
    bytes.pop_back();
    EXPECT_THROW(deserialize_tree(bytes), MalformedModelError);
    EXPECT_THROW(deserialize_tree({}), MalformedModelError);
}

TEST(TreeFormat, RejectsTrailingBytes) {
    std::vector<uint8_t> bytes = serialize_tree(*huff_encode_text("abc").tree);
    bytes.push_back(0);
    EXPECT_THROW(deserialize_tree(bytes), MalformedModelError);
}

TEST(TreeFormat, RejectsChecksumMismatch) {
    std::vector<uint8_t> bytes = serialize_tree(*huff_encode_text("abc").tree);
    bytes.back() ^= 0x01;
    EXPECT_THROW(deserialize_tree(bytes), MalformedModelError);
}

TEST(TreeFormat, AcceptsHandWrittenPayload) {
    ByteWriter w;
    put_internal(w, 3);
    put_leaf(w, 'x', 1);
    put_leaf(w, 'y', 2);
    HuffTree t = deserialize_tree(make_blob(w.bytes(), 3));
    EXPECT_EQ(t.leaf_count(), 2u);
    EXPECT_EQ(huff_decode_text("0110", t), "xyyx");
}

TEST(TreeFormat, RejectsUnknownTag) {
    ByteWriter w;
    put_internal(w, 3);
    put_leaf(w, 'x', 1);
    w.write_u8(0x07);
    w.write_u32_le('y');
    w.write_u64_le(2);
    EXPECT_THROW(deserialize_tree(make_blob(w.bytes(), 3)), MalformedModelError);
}

TEST(TreeFormat, RejectsAbsentRoot) {
    ByteWriter w;
    w.write_u8(kTagAbsent);
    put_leaf(w, 'x', 1);
    EXPECT_THROW(deserialize_tree(make_blob(w.bytes(), 1)), MalformedModelError);
}

TEST(TreeFormat, RejectsMissingChildBelowRoot) {
    ByteWriter w;
    put_internal(w, 2);
    put_internal(w, 1);
    put_leaf(w, 'x', 1);
    w.write_u8(kTagAbsent);
    put_leaf(w, 'y', 1);
    EXPECT_THROW(deserialize_tree(make_blob(w.bytes(), 4)), MalformedModelError);
}

TEST(TreeFormat, RejectsFrequencyMismatch) {
    ByteWriter w;
    put_internal(w, 5);
    put_leaf(w, 'x', 1);
    put_leaf(w, 'y', 1);
    EXPECT_THROW(deserialize_tree(make_blob(w.bytes(), 3)), MalformedModelError);
}

TEST(TreeFormat, RejectsNodeCountMismatch) {
    ByteWriter w;
    put_internal(w, 3);
    put_leaf(w, 'x', 1);
    put_leaf(w, 'y', 2);
    EXPECT_THROW(deserialize_tree(make_blob(w.bytes(), 2)), MalformedModelError);
    EXPECT_THROW(deserialize_tree(make_blob(w.bytes(), 0)), MalformedModelError);
    EXPECT_THROW(deserialize_tree(make_blob(w.bytes(), 1000)), MalformedModelError);
}
