// =============================================================================
// test_bech32.cpp -- Unit tests for bech32/bech32m and segwit addresses
// =============================================================================

#include <gtest/gtest.h>
#include "bech32.hpp"
#include "hex_utils.hpp"
#include "test_helpers.hpp"
#include <string>
#include <vector>

using signer::Bech32;
using signer::HexUtils;
using signer::SegwitAddress;
using signer::SignerError;
using signer_test::expect_signer_error;
using signer_test::from_hex;

// Test: BIP173 valid bech32 strings
TEST(Bech32, DecodeValidBech32) {
    for (const char* s : {"A12UEL5L", "a12uel5l",
                          "abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxw",
                          "split1checkupstagehandshakeupstreamerranterredcaperred2y9e3w"}) {
        auto result = Bech32::decode(s);
        EXPECT_EQ(result.encoding, Bech32::Encoding::Bech32) << s;
    }
}

// Test: BIP350 valid bech32m strings
TEST(Bech32, DecodeValidBech32m) {
    for (const char* s : {"A1LQFN3A", "a1lqfn3a", "abcdef1l7aum6echk45nj3s0wdvt2fg8x9yrzpqzd3ryx"}) {
        auto result = Bech32::decode(s);
        EXPECT_EQ(result.encoding, Bech32::Encoding::Bech32m) << s;
    }
}

// Test: decoding lowercases the human-readable part
TEST(Bech32, DecodeUppercaseHrp) {
    auto result = Bech32::decode("A12UEL5L");
    EXPECT_EQ(result.hrp, "a");
    EXPECT_TRUE(result.data.empty());
}

// Test: structural failures
TEST(Bech32, DecodeInvalid) {
    for (const char* s : {"pzry9x0s0muk",   // no separator
                          "1pzry9x0s0muk",  // empty hrp
                          "x1b4n0q5v",      // 'b' is not in the charset
                          "li1dgmt3",       // checksum too short
                          "A1G7SGD8",       // checksum computed over an uppercase hrp
                          "A12uEL5L"}) {    // mixed case
        EXPECT_EQ(Bech32::decode(s).encoding, Bech32::Encoding::Invalid) << s;
    }
}

// Test: strings over 90 characters are rejected even with a valid checksum layout
TEST(Bech32, DecodeTooLong) {
    std::string s = "a1" + std::string(89, 'q');
    EXPECT_EQ(Bech32::decode(s).encoding, Bech32::Encoding::Invalid);
}

// Test: 8-to-5 bit conversion pads with zeros; 5-to-8 refuses non-zero padding
TEST(Bech32, ConvertBits) {
    std::vector<uint8_t> five;
    std::vector<uint8_t> in = {0xff};
    ASSERT_TRUE(Bech32::convert_bits(five, in, 8, 5, true));
    EXPECT_EQ(five, (std::vector<uint8_t>{31, 28}));

    std::vector<uint8_t> eight;
    ASSERT_TRUE(Bech32::convert_bits(eight, five, 5, 8, false));
    EXPECT_EQ(eight, in);

    std::vector<uint8_t> dirty_padding = {31, 29};
    std::vector<uint8_t> rejected;
    EXPECT_FALSE(Bech32::convert_bits(rejected, dirty_padding, 5, 8, false));
}

// Test: BIP173 P2WPKH address for the key-1 hash, both networks
TEST(SegwitAddress, EncodeKnownVectors) {
    auto program = from_hex("751e76e8199196d454941c45d1b3a323f1433bd6");
    EXPECT_EQ(SegwitAddress::encode("bc", 0, program), "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");
    EXPECT_EQ(SegwitAddress::encode("tb", 0, program), "tb1qw508d6qejxtdg4y5r3zarvary0c5xw7kxpjzsx");
}

// Test: v0 32-byte program (P2WSH) and v1 bech32m program decode
TEST(SegwitAddress, DecodeKnownVectors) {
    auto p2wsh = SegwitAddress::decode("tb",
        "tb1qrp33g0q5c5txsp9arysrx4k6zdkfs4nce4xj0gdcccefvpysxf3q0sl5k7");
    ASSERT_TRUE(p2wsh.has_value());
    EXPECT_EQ(p2wsh->version, 0);
    EXPECT_EQ(HexUtils::encode(p2wsh->program),
              "1863143c14c5166804bd19203356da136c985678cd4d27a1b8c6329604903262");

    auto v1 = SegwitAddress::decode("bc",
        "bc1pw508d6qejxtdg4y5r3zarvary0c5xw7kw508d6qejxtdg4y5r3zarvary0c5xw7kt5nd6y");
    ASSERT_TRUE(v1.has_value());
    EXPECT_EQ(v1->version, 1);
    EXPECT_EQ(v1->program.size(), 40u);
}

// Test: uppercase addresses are valid
TEST(SegwitAddress, DecodeUppercase) {
    auto result = SegwitAddress::decode("bc", "BC1QW508D6QEJXTDG4Y5R3ZARVARY0C5XW7KV8F3T4");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(HexUtils::encode(result->program), "751e76e8199196d454941c45d1b3a323f1433bd6");
}

// Test: v0 with a bech32m checksum and a wrong hrp are rejected
TEST(SegwitAddress, DecodeRejects) {
    EXPECT_FALSE(SegwitAddress::decode("bc", "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kemeawh").has_value());
    EXPECT_FALSE(SegwitAddress::decode("tb", "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4").has_value());
}

// Test: encode refuses programs no segwit version allows
TEST(SegwitAddress, EncodeRejectsInvalidProgram) {
    expect_signer_error([] { SegwitAddress::encode("bc", 0, from_hex("0011223344")); },
                        SignerError::ErrorType::EncodingFailure);
    expect_signer_error([] { SegwitAddress::encode("bc", 17, from_hex("751e76e8199196d454941c45d1b3a323f1433bd6")); },
                        SignerError::ErrorType::EncodingFailure);
}
