#pragma once

#include "polygraph/common.hpp"
#include <algorithm>
#include <string>

namespace polygraph {

// Little-endian binary encoder used by log records and wire messages
class ByteWriter {
public:
    ByteWriter() = default;

    void write_u8(uint8_t value);
    void write_u32(uint32_t value);
    void write_u64(uint64_t value);

    // Length-prefixed (u32) variable data
    void write_string(const std::string& value);
    void write_bytes(const bytes& value);

    // Fixed-size data, no length prefix
    template<size_t N>
    void write_fixed(const fixed_bytes<N>& value) {
        data_.insert(data_.end(), value.begin(), value.end());
    }

    const bytes& data() const { return data_; }
    bytes take() { return std::move(data_); }
    size_t size() const { return data_.size(); }

private:
    bytes data_;
};

// Decoder counterpart of ByteWriter. Every read throws
// PolygraphException(DeserializationFailed) when the input is too short.
class ByteReader {
public:
    explicit ByteReader(const bytes& data) : data_(data), offset_(0) {}

    uint8_t read_u8();
    uint32_t read_u32();
    uint64_t read_u64();
    std::string read_string();
    bytes read_bytes();

    template<size_t N>
    fixed_bytes<N> read_fixed() {
        require(N);
        fixed_bytes<N> value;
        std::copy(data_.begin() + offset_, data_.begin() + offset_ + N, value.begin());
        offset_ += N;
        return value;
    }

    size_t remaining() const { return data_.size() - offset_; }
    bool at_end() const { return offset_ >= data_.size(); }

private:
    const bytes& data_;
    size_t offset_;

    void require(size_t count) const;
};

} // namespace polygraph
