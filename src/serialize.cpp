#include "serialize.hpp"
#include "error.hpp"
#include <string>

namespace signer {

void ByteReader::require(size_t count) const {
    if (count > remaining()) {
        throw SignerError(SignerError::ErrorType::MalformedContainer,
            "Unexpected end of data at offset " + std::to_string(pos_));
    }
}

uint8_t ByteReader::read_u8() {
    require(1);
    return data_[pos_++];
}

uint8_t ByteReader::peek_u8() const {
    require(1);
    return data_[pos_];
}

uint32_t ByteReader::read_u32_le() {
    require(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data_[pos_ + i]) << (8 * i);
    }
    pos_ += 4;
    return value;
}

uint64_t ByteReader::read_u64_le() {
    require(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
    }
    pos_ += 8;
    return value;
}

// CompactSize encoding:
// - value < 0xfd          : 1 byte
// - value <= 0xffff       : 0xfd followed by 2 bytes LE
// - value <= 0xffffffff   : 0xfe followed by 4 bytes LE
// - otherwise             : 0xff followed by 8 bytes LE
uint64_t ByteReader::read_compact_size() {
    uint8_t prefix = read_u8();
    uint64_t value = prefix;
    uint64_t minimum = 0;

    if (prefix == 0xfd) {
        require(2);
        value = static_cast<uint64_t>(data_[pos_]) | (static_cast<uint64_t>(data_[pos_ + 1]) << 8);
        pos_ += 2;
        minimum = 0xfd;
    } else if (prefix == 0xfe) {
        value = read_u32_le();
        minimum = 0x10000;
    } else if (prefix == 0xff) {
        value = read_u64_le();
        minimum = 0x100000000ULL;
    }

    if (value < minimum) {
        throw SignerError(SignerError::ErrorType::MalformedContainer, "Non-canonical CompactSize");
    }
    return value;
}

std::span<const uint8_t> ByteReader::read_bytes(size_t count) {
    require(count);
    auto bytes = data_.subspan(pos_, count);
    pos_ += count;
    return bytes;
}

std::vector<uint8_t> ByteReader::read_var_bytes() {
    uint64_t length = read_compact_size();
    if (length > remaining()) {
        throw SignerError(SignerError::ErrorType::MalformedContainer,
            "Length " + std::to_string(length) + " exceeds remaining data");
    }
    auto bytes = read_bytes(static_cast<size_t>(length));
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

void ByteWriter::write_u32_le(uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void ByteWriter::write_u64_le(uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void ByteWriter::write_compact_size(uint64_t value) {
    if (value < 0xfd) {
        write_u8(static_cast<uint8_t>(value));
    } else if (value <= 0xffff) {
        write_u8(0xfd);
        write_u8(static_cast<uint8_t>(value));
        write_u8(static_cast<uint8_t>(value >> 8));
    } else if (value <= 0xffffffffULL) {
        write_u8(0xfe);
        write_u32_le(static_cast<uint32_t>(value));
    } else {
        write_u8(0xff);
        write_u64_le(value);
    }
}

void ByteWriter::write_bytes(std::span<const uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::write_var_bytes(std::span<const uint8_t> bytes) {
    write_compact_size(bytes.size());
    write_bytes(bytes);
}

} // namespace signer
