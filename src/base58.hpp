#pragma once

#include <string>
#include <vector>
#include <span>
#include <cstdint>

namespace signer {

// Base58 is a utility class for Base58 and Base58Check encoding and decoding.
//
// Base58 is a binary-to-text encoding scheme used for bitcoin private keys (WIF)
// and legacy addresses. It uses a 58-character alphabet that leaves out easily
// confused characters (0, O, I, l). Base58Check appends the first 4 bytes of
// the double SHA256 of the payload as a checksum.
class Base58 {
public:
    static std::string encode(std::span<const uint8_t> data);

    // Decodes a Base58 string into bytes, no checksum handling
    static std::vector<uint8_t> decode(const std::string& encoded);

    static std::string encode_check(std::span<const uint8_t> payload);

    // Decodes a Base58Check string and returns the payload with the checksum removed
    static std::vector<uint8_t> decode_check(const std::string& encoded);

private:
    Base58() = delete;
};

} // namespace signer
