#pragma once

#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include "core/errors.hpp"

namespace hcodec {

// Little-endian byte sink.
class ByteWriter {
public:
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_le(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }
    void write_u32_le(uint32_t v) {
        write_u16_le(static_cast<uint16_t>(v & 0xFFFF));
        write_u16_le(static_cast<uint16_t>((v >> 16) & 0xFFFF));
    }
    void write_u64_le(uint64_t v) {
        write_u32_le(static_cast<uint32_t>(v & 0xFFFFFFFFu));
        write_u32_le(static_cast<uint32_t>(v >> 32));
    }
    void write_bytes(const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> release() { return std::move(buf_); }
private:
    std::vector<uint8_t> buf_;
};

// Little-endian reader over a borrowed buffer. Running past the end is a
// truncated model and raises MalformedModelError.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    uint8_t read_u8() {
        need(1);
        return data_[pos_++];
    }
    uint16_t read_u16_le() {
        uint16_t lo = read_u8();
        uint16_t hi = read_u8();
        return static_cast<uint16_t>(lo | (hi << 8));
    }
    uint32_t read_u32_le() {
        uint32_t a = read_u16_le();
        uint32_t b = read_u16_le();
        return a | (b << 16);
    }
    uint64_t read_u64_le() {
        uint64_t lo = read_u32_le();
        uint64_t hi = read_u32_le();
        return lo | (hi << 32);
    }
    void read_bytes(void* out, size_t n) {
        need(n);
        std::memcpy(out, data_ + pos_, n);
        pos_ += n;
    }
    bool eof() const { return pos_ >= size_; }
private:
    void need(size_t n) {
        if (n > size_ - pos_) throw MalformedModelError("bitstream: premature EOF");
    }
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

// CRC-32 (IEEE 802.3, reflected, poly 0xEDB88320).
uint32_t crc32(const uint8_t* data, size_t n);

} // namespace hcodec
