#include "base58.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <algorithm>
#include <openssl/crypto.h>

namespace signer {

namespace {

const std::string BASE58_CHARS =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr size_t CHECKSUM_SIZE = 4;

} // namespace

// Encodes bytes as a Base58 string.
//
// The input is treated as a big-endian number and repeatedly divided by 58.
// Each leading zero byte is represented by a leading '1' character.
std::string Base58::encode(std::span<const uint8_t> data) {
    size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // Base58 digits, most significant first
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);
    for (size_t i = leading_zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            carry += static_cast<uint32_t>(*it) << 8;
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.insert(digits.begin(), static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(leading_zeros, '1');
    result.reserve(leading_zeros + digits.size());
    for (uint8_t digit : digits) {
        result.push_back(BASE58_CHARS[digit]);
    }
    return result;
}

// Decodes a Base58-encoded string into bytes.
//
// The decoding process:
// 1. Converts each Base58 character to its corresponding value
// 2. Builds the result by multiplying existing value by 58 and adding new digits
// 3. Handles leading '1' characters (which represent leading zeros)
//
// Throws:
//   SignerError(InvalidEncoding) if a character is outside the Base58 alphabet
std::vector<uint8_t> Base58::decode(const std::string& base58_string) {
    std::vector<uint8_t> result;
    for (char c : base58_string) {
        auto digit = BASE58_CHARS.find(c);
        if (digit == std::string::npos) {
            throw SignerError(SignerError::ErrorType::InvalidEncoding,
                "Invalid Base58 character");
        }

        // Multiply existing result by 58 and add new digit
        size_t carry = digit;
        for (auto it = result.rbegin(); it != result.rend(); ++it) {
            carry += static_cast<size_t>(*it) * 58;
            *it = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }

        while (carry > 0) {
            result.insert(result.begin(), static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    // Handle leading '1' characters (0x00 bytes in output)
    for (char c : base58_string) {
        if (c != '1') break;
        result.insert(result.begin(), 0);
    }

    return result;
}

std::string Base58::encode_check(std::span<const uint8_t> payload) {
    std::vector<uint8_t> data(payload.begin(), payload.end());
    auto checksum = HashUtils::double_sha256(payload);
    data.insert(data.end(), checksum.begin(), checksum.begin() + CHECKSUM_SIZE);
    auto encoded = encode(data);
    OPENSSL_cleanse(data.data(), data.size());
    return encoded;
}

// Decodes a Base58Check string.
//
// The trailing 4 bytes must equal the first 4 bytes of SHA256(SHA256(payload)).
// The returned payload excludes the checksum.
//
// Throws:
//   SignerError(InvalidEncoding) if the input is not Base58 or is too short
//   SignerError(InvalidChecksum) if the checksum does not match
std::vector<uint8_t> Base58::decode_check(const std::string& encoded) {
    auto data = decode(encoded);
    if (data.size() < CHECKSUM_SIZE) {
        throw SignerError(SignerError::ErrorType::InvalidEncoding,
            "Base58Check string is too short");
    }

    std::span<const uint8_t> payload(data.data(), data.size() - CHECKSUM_SIZE);
    auto expected = HashUtils::double_sha256(payload);
    if (!std::equal(expected.begin(), expected.begin() + CHECKSUM_SIZE,
                    data.end() - CHECKSUM_SIZE)) {
        OPENSSL_cleanse(data.data(), data.size());
        throw SignerError(SignerError::ErrorType::InvalidChecksum,
            "Invalid Base58Check checksum");
    }

    std::vector<uint8_t> result(payload.begin(), payload.end());
    OPENSSL_cleanse(data.data(), data.size());
    return result;
}

} // namespace signer
