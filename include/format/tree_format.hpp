#pragma once

#include <cstdint>
#include <vector>

#include "tree/huffman_tree.hpp"

namespace hcodec {

// IMPORTANT:
// Do NOT write/read this struct by dumping raw memory or using sizeof(TreeFileHeader).
// Struct padding/alignment is compiler-dependent. Always serialize field-by-field.
inline constexpr uint16_t kTreeFormatVersion = 1;
inline constexpr uint16_t kTreeHeaderBytes = 20; // fixed on-disk header size for v1

// Node tags in the payload.
inline constexpr uint8_t kTagAbsent = 0x00;   // + nothing
inline constexpr uint8_t kTagLeaf = 0x01;     // + symbol u32 + freq u64
inline constexpr uint8_t kTagInternal = 0x02; // + freq u64, then left, right

// .huft file layout:
// [Header][payload: nodes in pre-order]
//
// Header fields are little-endian.
struct TreeFileHeader {
    char     magic[4];        // "HUFT"
    uint16_t version;         // format version
    uint16_t header_bytes;    // fixed header size

    uint32_t node_count;      // arena nodes (absent slot not counted)
    uint32_t payload_bytes;   // bytes after header
    uint32_t checksum;        // CRC-32 of payload
};

std::vector<uint8_t> serialize_tree(const HuffTree& tree);

// Throws MalformedModelError on any format or structural violation.
HuffTree deserialize_tree(const std::vector<uint8_t>& bytes);

TreeFileHeader read_tree_header(const std::vector<uint8_t>& bytes);

} // namespace hcodec
