#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace signer {

// Cursor over a byte buffer with bitcoin's little-endian and CompactSize
// encodings. Reading past the end throws SignerError(MalformedContainer).
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data), pos_(0) {}

    uint8_t read_u8();
    uint32_t read_u32_le();
    uint64_t read_u64_le();

    // Rejects non-canonical encodings
    uint64_t read_compact_size();

    std::span<const uint8_t> read_bytes(size_t count);

    // CompactSize length followed by that many bytes
    std::vector<uint8_t> read_var_bytes();

    uint8_t peek_u8() const;
    size_t remaining() const { return data_.size() - pos_; }
    size_t position() const { return pos_; }
    bool empty() const { return pos_ == data_.size(); }

private:
    void require(size_t count) const;

    std::span<const uint8_t> data_;
    size_t pos_;
};

class ByteWriter {
public:
    void write_u8(uint8_t value) { buffer_.push_back(value); }
    void write_u32_le(uint32_t value);
    void write_u64_le(uint64_t value);
    void write_compact_size(uint64_t value);
    void write_bytes(std::span<const uint8_t> bytes);
    void write_var_bytes(std::span<const uint8_t> bytes);

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

} // namespace signer
