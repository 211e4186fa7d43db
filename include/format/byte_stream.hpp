#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "util/errors.hpp"

namespace satish {

// Big-endian byte sink for the container header.
class ByteWriter {
public:
    void write_u8(uint8_t v) { buf_.push_back(v); }
    void write_u16_be(uint16_t v) {
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
    }
    void write_bytes(const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    void reserve(size_t n) { buf_.reserve(n); }
    size_t size() const { return buf_.size(); }
    std::vector<uint8_t> take() { return std::move(buf_); }
private:
    std::vector<uint8_t> buf_;
};

// Non-owning big-endian reader over a byte range.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<uint8_t>& data) : ByteReader(data.data(), data.size()) {}

    uint8_t read_u8() {
        need(1);
        return data_[pos_++];
    }
    uint16_t read_u16_be() {
        uint16_t hi = read_u8();
        uint16_t lo = read_u8();
        return static_cast<uint16_t>((hi << 8) | lo);
    }
    void read_bytes(void* out, size_t n) {
        need(n);
        std::memcpy(out, data_ + pos_, n);
        pos_ += n;
    }
    size_t remaining() const { return size_ - pos_; }
private:
    void need(size_t n) {
        if (n > size_ - pos_) {
            throw InvalidFormat("header", "bytestream: premature EOF at offset " + std::to_string(pos_));
        }
    }
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

} // namespace satish
