#ifndef PAPER_UTIL_BINARY_IO_HPP
#define PAPER_UTIL_BINARY_IO_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace paper::util {
/*
    note: the paper protocol is little-endian throughout, unlike most network protocols.
    strings and buffers are always [u32 length][bytes].

    writers append to a byte vector. ByteReader walks a borrowed buffer and throws ShortBuffer
    when the field it was asked for is not fully there yet - the codec turns that into
    "need more data" instead of an error.
*/

struct ShortBuffer : std::out_of_range {
    using std::out_of_range::out_of_range;
};

inline void write_u8(std::vector<uint8_t>& buf, uint8_t value) {
    buf.push_back(value);
}

inline void write_u32_le(std::vector<uint8_t>& buf, uint32_t value) {
    buf.push_back(value & 0xFF);  // least significant byte first
    buf.push_back((value >> 8) & 0xFF);
    buf.push_back((value >> 16) & 0xFF);
    buf.push_back((value >> 24) & 0xFF);
    /*
        example: value = 0x12345678
        buf: [0x78, 0x56, 0x34, 0x12]
    */
}

inline void write_u64_le(std::vector<uint8_t>& buf, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back((value >> (i * 8)) & 0xFF);
    }
}

inline void write_f64_le(std::vector<uint8_t>& buf, double value) {
    uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(value));
    std::memcpy(&bits, &value, sizeof(bits));
    write_u64_le(buf, bits);
}

inline void write_string(std::vector<uint8_t>& buf, std::string_view s) {
    write_u32_le(buf, static_cast<uint32_t>(s.size()));  // length prefix
    buf.insert(buf.end(), s.begin(), s.end());           // raw bytes
}

inline uint32_t read_u32_le(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) | (static_cast<uint32_t>(data[3]) << 24);
}

inline uint64_t read_u64_le(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | data[i];
    }
    return value;
}

class ByteReader {
   public:
    ByteReader(const uint8_t* data, std::size_t size) noexcept : data_(data), size_(size) {}

    uint8_t read_u8() {
        require(1);
        return data_[offset_++];
    }

    uint32_t read_u32() {
        require(4);
        uint32_t value = read_u32_le(data_ + offset_);
        offset_ += 4;
        return value;
    }

    uint64_t read_u64() {
        require(8);
        uint64_t value = read_u64_le(data_ + offset_);
        offset_ += 8;
        return value;
    }

    double read_f64() {
        uint64_t bits = read_u64();
        double value = 0;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::string read_string() {
        uint32_t len = read_u32();
        require(len);
        std::string result(reinterpret_cast<const char*>(data_ + offset_), len);
        offset_ += len;
        return result;
    }

    [[nodiscard]] std::size_t offset() const noexcept {
        return offset_;
    }

   private:
    void require(std::size_t n) const {
        if (size_ - offset_ < n) {
            throw ShortBuffer("need " + std::to_string(n) + " more bytes at offset " +
                              std::to_string(offset_));
        }
    }

    const uint8_t* data_;
    std::size_t size_;
    std::size_t offset_ = 0;
};

}  // namespace paper::util

#endif
