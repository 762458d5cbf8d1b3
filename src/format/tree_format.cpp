#include "format/tree_format.hpp"

#include "core/errors.hpp"
#include "entropy/bitstream.hpp"

#include <limits>
#include <string>
#include <utility>

namespace hcodec {

namespace {

// smallest encoded node: internal tag + freq
constexpr size_t kMinNodeBytes = 1 + 8;

struct Slot {
    int parent;    // kNoChild for the root slot
    bool is_left;
};

} // namespace

std::vector<uint8_t> serialize_tree(const HuffTree& tree) {
    ByteWriter payload;
    std::vector<int> stack;
    stack.push_back(tree.root());
    while (!stack.empty()) {
        int idx = stack.back();
        stack.pop_back();
        if (idx == kNoChild) {
            payload.write_u8(kTagAbsent);
            continue;
        }
        const TreeNode& n = tree.node(idx);
        if (const auto* leaf = std::get_if<Leaf>(&n)) {
            payload.write_u8(kTagLeaf);
            payload.write_u32_le(leaf->symbol);
            payload.write_u64_le(leaf->freq);
            continue;
        }
        const Internal& in = std::get<Internal>(n);
        payload.write_u8(kTagInternal);
        payload.write_u64_le(in.freq);
        stack.push_back(in.right);
        stack.push_back(in.left);
    }

    const std::vector<uint8_t>& body = payload.bytes();
    if (body.size() > std::numeric_limits<uint32_t>::max() ||
        tree.size() > std::numeric_limits<uint32_t>::max()) {
        throw MalformedModelError("serialize: tree too large for format v1");
    }

    ByteWriter w;
    w.write_bytes("HUFT", 4);
    w.write_u16_le(kTreeFormatVersion);
    w.write_u16_le(kTreeHeaderBytes);
    w.write_u32_le(static_cast<uint32_t>(tree.size()));
    w.write_u32_le(static_cast<uint32_t>(body.size()));
    w.write_u32_le(crc32(body.data(), body.size()));
    w.write_bytes(body.data(), body.size());
    return w.release();
}

TreeFileHeader read_tree_header(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < kTreeHeaderBytes) throw MalformedModelError("deserialize: file too small");

    ByteReader r(bytes.data(), bytes.size());
    TreeFileHeader hdr{};
    r.read_bytes(hdr.magic, 4);
    hdr.version = r.read_u16_le();
    hdr.header_bytes = r.read_u16_le();
    hdr.node_count = r.read_u32_le();
    hdr.payload_bytes = r.read_u32_le();
    hdr.checksum = r.read_u32_le();

    if (!(hdr.magic[0] == 'H' && hdr.magic[1] == 'U' && hdr.magic[2] == 'F' && hdr.magic[3] == 'T')) {
        throw MalformedModelError("deserialize: bad magic");
    }
    if (hdr.version != kTreeFormatVersion) throw MalformedModelError("deserialize: unsupported version");
    if (hdr.header_bytes < kTreeHeaderBytes) throw MalformedModelError("deserialize: invalid header_bytes");
    if (bytes.size() < hdr.header_bytes) throw MalformedModelError("deserialize: truncated header");
    return hdr;
}

HuffTree deserialize_tree(const std::vector<uint8_t>& bytes) {
    const TreeFileHeader hdr = read_tree_header(bytes);
    const size_t available = bytes.size() - hdr.header_bytes;
    if (available < hdr.payload_bytes) {
        throw MalformedModelError("deserialize: payload truncated");
    }
    if (available > hdr.payload_bytes) {
        throw MalformedModelError("deserialize: trailing bytes after payload");
    }
    const uint8_t* payload = bytes.data() + hdr.header_bytes;
    if (crc32(payload, hdr.payload_bytes) != hdr.checksum) {
        throw MalformedModelError("deserialize: checksum mismatch");
    }
    if (hdr.node_count == 0 || hdr.node_count > hdr.payload_bytes / kMinNodeBytes) {
        throw MalformedModelError("deserialize: implausible node_count " + std::to_string(hdr.node_count));
    }

    ByteReader r(payload, hdr.payload_bytes);
    std::vector<TreeNode> nodes;
    nodes.reserve(hdr.node_count);

    std::vector<Slot> pending;
    pending.push_back({kNoChild, true});
    while (!pending.empty()) {
        const Slot slot = pending.back();
        pending.pop_back();

        int idx = kNoChild;
        const uint8_t tag = r.read_u8();
        if (tag == kTagAbsent) {
            if (slot.parent == kNoChild) {
                throw MalformedModelError("deserialize: absent root");
            }
        } else if (tag == kTagLeaf || tag == kTagInternal) {
            if (nodes.size() >= hdr.node_count) {
                throw MalformedModelError("deserialize: more nodes than node_count");
            }
            idx = static_cast<int>(nodes.size());
            if (tag == kTagLeaf) {
                Leaf leaf;
                leaf.symbol = r.read_u32_le();
                leaf.freq = r.read_u64_le();
                nodes.emplace_back(leaf);
            } else {
                Internal in;
                in.freq = r.read_u64_le();
                nodes.emplace_back(in);
                pending.push_back({idx, false});
                pending.push_back({idx, true});
            }
        } else {
            throw MalformedModelError("deserialize: unknown node tag " + std::to_string(tag));
        }

        if (slot.parent != kNoChild) {
            Internal& parent = std::get<Internal>(nodes[slot.parent]);
            if (slot.is_left) parent.left = idx;
            else parent.right = idx;
        }
    }

    if (nodes.size() != hdr.node_count) {
        throw MalformedModelError("deserialize: node_count mismatch");
    }
    if (!r.eof()) {
        throw MalformedModelError("deserialize: trailing bytes in payload");
    }
    // root is always the first node in pre-order
    return HuffTree(std::move(nodes), 0);
}

} // namespace hcodec
