// =============================================================================
// test_hex_utils.cpp -- Unit tests for hex decoding and encoding
// =============================================================================

#include <gtest/gtest.h>
#include "hex_utils.hpp"
#include "test_helpers.hpp"
#include <cstdint>
#include <string>
#include <vector>

using signer::HexUtils;
using signer::SignerError;
using signer_test::expect_signer_error;

// Test: lowercase and uppercase digits decode to the same bytes
TEST(HexUtils, DecodeMixedCase) {
    std::vector<uint8_t> expected = {0xde, 0xad, 0xbe, 0xef, 0x00, 0x7f};
    EXPECT_EQ(HexUtils::decode("deadbeef007f"), expected);
    EXPECT_EQ(HexUtils::decode("DEADBEEF007F"), expected);
    EXPECT_EQ(HexUtils::decode("DeAdBeEf007F"), expected);
}

// Test: empty string decodes to no bytes
TEST(HexUtils, DecodeEmpty) {
    EXPECT_TRUE(HexUtils::decode("").empty());
}

// Test: odd length is rejected
TEST(HexUtils, DecodeOddLength) {
    expect_signer_error([] { HexUtils::decode("abc"); }, SignerError::ErrorType::InvalidEncoding);
}

// Test: characters outside [0-9a-fA-F] are rejected
TEST(HexUtils, DecodeInvalidCharacter) {
    expect_signer_error([] { HexUtils::decode("xyz0"); }, SignerError::ErrorType::InvalidEncoding);
    expect_signer_error([] { HexUtils::decode("0g"); }, SignerError::ErrorType::InvalidEncoding);
    expect_signer_error([] { HexUtils::decode("00 1"); }, SignerError::ErrorType::InvalidEncoding);
}

// Test: the exact-length variant reports InvalidLength
TEST(HexUtils, DecodeExpectedSize) {
    EXPECT_EQ(HexUtils::decode("0102", 2).size(), 2u);
    expect_signer_error([] { HexUtils::decode("010203", 2); }, SignerError::ErrorType::InvalidLength);
}

// Test: bad characters win over a wrong length
TEST(HexUtils, DecodeExpectedSizeStillValidatesEncoding) {
    expect_signer_error([] { HexUtils::decode("zz", 32); }, SignerError::ErrorType::InvalidEncoding);
}

// Test: encoding is always lowercase
TEST(HexUtils, EncodeLowercase) {
    std::vector<uint8_t> data = {0x00, 0x0a, 0xab, 0xff};
    EXPECT_EQ(HexUtils::encode(data), "000aabff");
}

// Test: encode(decode(s)) normalizes case
TEST(HexUtils, EncodeNormalizesCase) {
    EXPECT_EQ(HexUtils::encode(HexUtils::decode("ABCDEF")), "abcdef");
}
