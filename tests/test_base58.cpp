// =============================================================================
// test_base58.cpp -- Unit tests for Base58 and Base58Check
// =============================================================================

#include <gtest/gtest.h>
#include "base58.hpp"
#include "test_helpers.hpp"
#include <cstdint>
#include <string>
#include <vector>

using signer::Base58;
using signer::SignerError;
using signer_test::expect_signer_error;
using signer_test::from_hex;

// Test: known vector "hello world"
TEST(Base58, EncodeHelloWorld) {
    std::string text = "hello world";
    std::vector<uint8_t> data(text.begin(), text.end());
    EXPECT_EQ(Base58::encode(data), "StV1DL6CwTryKyV");
}

// Test: leading zero bytes become leading '1' characters
TEST(Base58, LeadingZeros) {
    std::vector<uint8_t> data = {0x00, 0x00, 0x01};
    EXPECT_EQ(Base58::encode(data), "112");
    EXPECT_EQ(Base58::decode("112"), data);
}

// Test: decode reverses encode
TEST(Base58, DecodeHelloWorld) {
    auto decoded = Base58::decode("StV1DL6CwTryKyV");
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), "hello world");
}

// Test: characters outside the alphabet (0, O, I, l) are rejected
TEST(Base58, RejectsInvalidCharacters) {
    expect_signer_error([] { Base58::decode("StV1DL6CwTryKy0"); }, SignerError::ErrorType::InvalidEncoding);
    expect_signer_error([] { Base58::decode("OIl"); }, SignerError::ErrorType::InvalidEncoding);
}

// Test: Base58Check strips the 4-byte checksum
TEST(Base58, DecodeCheckPayload) {
    auto payload = Base58::decode_check("KwDiBf89QgGbjEhKnhXJuH7LrciVrZi3qYjgd9M7rFU73sVHnoWn");
    ASSERT_EQ(payload.size(), 34u);
    EXPECT_EQ(payload[0], 0x80);
    EXPECT_EQ(payload[32], 0x01);
    EXPECT_EQ(payload[33], 0x01);
}

// Test: encode_check produces the WIF of private key 1
TEST(Base58, EncodeCheckKnownVector) {
    auto payload = from_hex("80" "0000000000000000000000000000000000000000000000000000000000000001" "01");
    EXPECT_EQ(Base58::encode_check(payload), "KwDiBf89QgGbjEhKnhXJuH7LrciVrZi3qYjgd9M7rFU73sVHnoWn");
}

// Test: a single changed character fails the checksum
TEST(Base58, DecodeCheckBadChecksum) {
    expect_signer_error([] {
        Base58::decode_check("cVt4o7BGAig1UXywgGSmARhxMdzP5qvQsxKkSsc1XEkw3tDTQFpz");
    }, SignerError::ErrorType::InvalidChecksum);
}

// Test: input shorter than a checksum is not Base58Check
TEST(Base58, DecodeCheckTooShort) {
    expect_signer_error([] { Base58::decode_check("1"); }, SignerError::ErrorType::InvalidEncoding);
}
