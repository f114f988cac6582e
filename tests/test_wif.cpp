// =============================================================================
// test_wif.cpp -- Unit tests for WIF private key import and export
// =============================================================================

#include <gtest/gtest.h>
#include "wif.hpp"
#include "hex_utils.hpp"
#include "test_helpers.hpp"
#include <string>

using signer::HexUtils;
using signer::Network;
using signer::PrivateKey;
using signer::SignerError;
using signer::Wif;
using signer_test::expect_signer_error;
using signer_test::from_hex;

namespace {

const std::string TESTNET_WIF = "cVt4o7BGAig1UXywgGSmARhxMdzP5qvQsxKkSsc1XEkw3tDTQFpy";
const std::string TESTNET_KEY = "f7a1d6cd23bc345dd57abe045d6026f4acf69a637c9e5840e232832bcf4ce58d";
const std::string MAINNET_WIF_SAME_KEY = "L5X5LCBQjeykK6WgHrddo7CtjQgyRPpiovBHLT9W286vo95PwRxE";

} // namespace

// Test: compressed testnet WIF decodes to the expected scalar
TEST(Wif, DecodeTestnetCompressed) {
    auto key = Wif::decode(TESTNET_WIF, Network::Testnet);
    EXPECT_EQ(HexUtils::encode(key.bytes()), TESTNET_KEY);
    EXPECT_TRUE(key.compressed());
}

// Test: private key 1 on mainnet
TEST(Wif, DecodeMainnetKeyOne) {
    auto key = Wif::decode("KwDiBf89QgGbjEhKnhXJuH7LrciVrZi3qYjgd9M7rFU73sVHnoWn", Network::Mainnet);
    EXPECT_EQ(HexUtils::encode(key.bytes()),
              "0000000000000000000000000000000000000000000000000000000000000001");
}

// Test: private key n-1 is the largest valid scalar
TEST(Wif, DecodeMainnetKeyOrderMinusOne) {
    auto key = Wif::decode("L5oLkpV3aqBjhki6LmvChTCV6odsp4SXM6FfU2Gppt5kFLaHLuZ9", Network::Mainnet);
    EXPECT_EQ(HexUtils::encode(key.bytes()),
              "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364140");
}

// Test: uncompressed WIF (no 0x01 flag) is accepted and recorded as uncompressed
TEST(Wif, DecodeUncompressed) {
    auto key = Wif::decode("93TybTmvHFRhSGdTtVRR43RgjHY8GbeUcZUMifCZHpXLx5uvKft", Network::Testnet);
    EXPECT_EQ(HexUtils::encode(key.bytes()), TESTNET_KEY);
    EXPECT_FALSE(key.compressed());

    auto mainnet = Wif::decode("5JZGuGYM4vfKvpxaJg5g5D3uvVYVQ74UUdueCVvWCNacrAkkvGi", Network::Mainnet);
    EXPECT_EQ(HexUtils::encode(mainnet.bytes()),
              "619c335025c7f4012e556c2a58b2506e30b8511b53ade95ea316fd8c3286feb9");
}

// Test: a testnet WIF is rejected when mainnet is requested, and vice versa
TEST(Wif, NetworkMismatch) {
    expect_signer_error([] { Wif::decode(TESTNET_WIF, Network::Mainnet); },
                        SignerError::ErrorType::NetworkMismatch);
    expect_signer_error([] { Wif::decode(MAINNET_WIF_SAME_KEY, Network::Testnet); },
                        SignerError::ErrorType::NetworkMismatch);
}

// Test: corrupted checksum
TEST(Wif, BadChecksum) {
    expect_signer_error([] {
        Wif::decode("cVt4o7BGAig1UXywgGSmARhxMdzP5qvQsxKkSsc1XEkw3tDTQFpz", Network::Testnet);
    }, SignerError::ErrorType::InvalidChecksum);
}

// Test: a checksum failure is reported before the network check
TEST(Wif, ChecksumCheckedBeforeNetwork) {
    expect_signer_error([] {
        Wif::decode("cVt4o7BGAig1UXywgGSmARhxMdzP5qvQsxKkSsc1XEkw3tDTQFpz", Network::Mainnet);
    }, SignerError::ErrorType::InvalidChecksum);
}

// Test: zero scalar is out of range
TEST(Wif, ZeroKey) {
    expect_signer_error([] {
        Wif::decode("cMahea7zqjxrtgAbB7LSGbcQUr1uX1ojuat9jZodMN87J7g8rY9t", Network::Testnet);
    }, SignerError::ErrorType::InvalidPrivateKey);
}

// Test: scalar equal to the curve order is out of range
TEST(Wif, KeyEqualToOrder) {
    expect_signer_error([] {
        Wif::decode("cWALDjUu1tszsCBMjBjL4mhYj2wHUWYDR8Q8aSjLKzjkWaXMLRaY", Network::Testnet);
    }, SignerError::ErrorType::InvalidPrivateKey);
}

// Test: a 34-byte payload must end in the 0x01 compression flag
TEST(Wif, BadCompressionFlag) {
    expect_signer_error([] {
        Wif::decode("cVt4o7BGAig1UXywgGSmARhxMdzP5qvQsxKkSsc1XEkw3tGYTp92", Network::Testnet);
    }, SignerError::ErrorType::InvalidPrivateKey);
}

// Test: a payload with a 31-byte key
TEST(Wif, ShortPayload) {
    expect_signer_error([] {
        Wif::decode("2pgeHsUPwtJNrE4H4WYp8wULspFJWMzRqPJyobUzcXhrryyb1N", Network::Testnet);
    }, SignerError::ErrorType::InvalidPrivateKey);
}

// Test: garbage that is not Base58 at all
TEST(Wif, NotBase58) {
    expect_signer_error([] { Wif::decode("not a wif", Network::Testnet); },
                        SignerError::ErrorType::InvalidEncoding);
    expect_signer_error([] { Wif::decode("", Network::Testnet); },
                        SignerError::ErrorType::InvalidEncoding);
}

// Test: export produces the canonical WIF for each network
TEST(Wif, EncodeBothNetworks) {
    PrivateKey key(from_hex(TESTNET_KEY));
    EXPECT_EQ(Wif::encode(key, Network::Testnet), TESTNET_WIF);
    EXPECT_EQ(Wif::encode(key, Network::Mainnet), MAINNET_WIF_SAME_KEY);
}

// Test: export keeps the compression flag of the imported key
TEST(Wif, EncodeUncompressed) {
    auto key = Wif::decode("5JZGuGYM4vfKvpxaJg5g5D3uvVYVQ74UUdueCVvWCNacrAkkvGi", Network::Mainnet);
    EXPECT_EQ(Wif::encode(key, Network::Mainnet), "5JZGuGYM4vfKvpxaJg5g5D3uvVYVQ74UUdueCVvWCNacrAkkvGi");
}
