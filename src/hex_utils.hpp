#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "error.hpp"

namespace signer {

class HexUtils {
public:
    // Convert a hexadecimal string to a byte vector.
    // Upper and lower case digits are accepted; anything else is InvalidEncoding.
    static std::vector<uint8_t> decode(std::string_view hex) {
        if (hex.length() % 2 != 0) {
            throw SignerError(SignerError::ErrorType::InvalidEncoding,
                "Hex must have even length");
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.length() / 2);

        for (size_t i = 0; i < hex.length(); i += 2) {
            int high = nibble(hex[i]);
            int low = nibble(hex[i + 1]);
            if (high < 0 || low < 0) {
                throw SignerError(SignerError::ErrorType::InvalidEncoding,
                    "Hex must contain only 0-9 and a-f");
            }
            bytes.push_back(static_cast<uint8_t>((high << 4) | low));
        }

        return bytes;
    }

    // Same as decode, but the result must be exactly expected_size bytes
    static std::vector<uint8_t> decode(std::string_view hex, size_t expected_size) {
        auto bytes = decode(hex);
        if (bytes.size() != expected_size) {
            throw SignerError(SignerError::ErrorType::InvalidLength,
                "Hex must be " + std::to_string(expected_size * 2) + " chars long");
        }
        return bytes;
    }

    // Convert a byte sequence to a lowercase hexadecimal string
    static std::string encode(std::span<const uint8_t> data) {
        std::string result;
        result.reserve(data.size() * 2);

        static const char hex_chars[] = "0123456789abcdef";
        for (uint8_t byte : data) {
            result.push_back(hex_chars[byte >> 4]);
            result.push_back(hex_chars[byte & 0x0F]);
        }

        return result;
    }

private:
    static int nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    HexUtils() = delete;
};

} // namespace signer
