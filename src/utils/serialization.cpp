#include "polygraph/serialization.hpp"
#include "polygraph/error.hpp"

namespace polygraph {

// ByteWriter implementation

void ByteWriter::write_u8(uint8_t value) {
    data_.push_back(value);
}

void ByteWriter::write_u32(uint32_t value) {
    for (int i = 0; i < 4; i++) {
        data_.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

void ByteWriter::write_u64(uint64_t value) {
    for (int i = 0; i < 8; i++) {
        data_.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

void ByteWriter::write_string(const std::string& value) {
    write_u32(static_cast<uint32_t>(value.size()));
    data_.insert(data_.end(), value.begin(), value.end());
}

void ByteWriter::write_bytes(const bytes& value) {
    write_u32(static_cast<uint32_t>(value.size()));
    data_.insert(data_.end(), value.begin(), value.end());
}

// ByteReader implementation

void ByteReader::require(size_t count) const {
    if (offset_ + count > data_.size()) {
        throw PolygraphException(ErrorCode::DeserializationFailed,
            "Unexpected end of data (need " + std::to_string(count) +
            " bytes, have " + std::to_string(data_.size() - offset_) + ")");
    }
}

uint8_t ByteReader::read_u8() {
    require(1);
    return data_[offset_++];
}

uint32_t ByteReader::read_u32() {
    require(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; i++) {
        value |= static_cast<uint32_t>(data_[offset_++]) << (i * 8);
    }
    return value;
}

uint64_t ByteReader::read_u64() {
    require(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value |= static_cast<uint64_t>(data_[offset_++]) << (i * 8);
    }
    return value;
}

std::string ByteReader::read_string() {
    uint32_t length = read_u32();
    require(length);
    std::string value(data_.begin() + offset_, data_.begin() + offset_ + length);
    offset_ += length;
    return value;
}

bytes ByteReader::read_bytes() {
    uint32_t length = read_u32();
    require(length);
    bytes value(data_.begin() + offset_, data_.begin() + offset_ + length);
    offset_ += length;
    return value;
}

} // namespace polygraph
