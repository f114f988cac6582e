// =============================================================================
// test_transaction.cpp -- Unit tests for transaction parsing and serialization
// =============================================================================

#include <gtest/gtest.h>
#include "transaction.hpp"
#include "hex_utils.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <string>

using signer::HexUtils;
using signer::SignerError;
using signer::Transaction;
using signer_test::expect_signer_error;
using signer_test::from_hex;

namespace {

// BIP143 native P2WPKH example, unsigned
const std::string BIP143_UNSIGNED_TX =
    "0100000002fff7f7881a8099afa6940d42d1e7f6362bec38171ea3edf433541db4e4ad969f0000000000eeffffff"
    "ef51e1b804cc89d182d279655c3aa89e815b1b309fe287d9b2b55d57b90ec68a0100000000ffffffff02202cb206"
    "000000001976a9148280b37df378db99f66f85c95a783a76ac7a6d5988ac9093510d000000001976a9143bde42db"
    "ee7e4dbe6a21b2d50ce2f0167faa815988ac11000000";

std::string display_txid(const Transaction& tx) {
    auto id = tx.txid();
    std::reverse(id.begin(), id.end());
    return HexUtils::encode(id);
}

} // namespace

// Test: fields of the BIP143 example transaction
TEST(Transaction, ParseBip143Unsigned) {
    auto tx = Transaction::parse(from_hex(BIP143_UNSIGNED_TX));
    EXPECT_EQ(tx.version, 1u);
    ASSERT_EQ(tx.inputs.size(), 2u);
    EXPECT_EQ(tx.inputs[0].prevout.index, 0u);
    EXPECT_EQ(tx.inputs[0].sequence, 0xffffffeeu);
    EXPECT_EQ(tx.inputs[1].prevout.index, 1u);
    EXPECT_EQ(tx.inputs[1].sequence, 0xffffffffu);
    ASSERT_EQ(tx.outputs.size(), 2u);
    EXPECT_EQ(tx.outputs[0].amount, 112340000u);
    EXPECT_EQ(tx.outputs[1].amount, 223450000u);
    EXPECT_EQ(tx.locktime, 17u);
    EXPECT_FALSE(tx.has_witness());
}

// Test: serialization reproduces the input bytes and the txid is the known one
TEST(Transaction, SerializeAndTxid) {
    auto tx = Transaction::parse(from_hex(BIP143_UNSIGNED_TX));
    EXPECT_EQ(HexUtils::encode(tx.serialize()), BIP143_UNSIGNED_TX);
    EXPECT_EQ(display_txid(tx), "3335ffae0df20c5407e8de12b49405c8e912371f00fe4132bfaf95ad49c40243");
}

// Test: witness data uses marker/flag and does not change the txid
TEST(Transaction, WitnessSerialization) {
    auto tx = Transaction::parse(from_hex(BIP143_UNSIGNED_TX));
    auto txid = tx.txid();
    tx.inputs[1].witness = {from_hex("3001"), from_hex("02aa")};

    auto bytes = tx.serialize();
    EXPECT_EQ(bytes[4], 0x00);
    EXPECT_EQ(bytes[5], 0x01);

    auto reparsed = Transaction::parse(bytes);
    ASSERT_TRUE(reparsed.has_witness());
    EXPECT_TRUE(reparsed.inputs[0].witness.empty());
    EXPECT_EQ(reparsed.inputs[1].witness.size(), 2u);
    EXPECT_EQ(reparsed.serialize(), bytes);
    EXPECT_EQ(reparsed.txid(), txid);
    EXPECT_EQ(HexUtils::encode(reparsed.serialize(false)), BIP143_UNSIGNED_TX);
}

// Test: marker/flag followed by only empty witnesses is rejected
TEST(Transaction, SuperfluousWitness) {
    auto hex = "01000000" "0001" + BIP143_UNSIGNED_TX.substr(8, BIP143_UNSIGNED_TX.size() - 16) +
               "0000" "11000000";
    expect_signer_error([&hex] { Transaction::parse(from_hex(hex)); },
                        SignerError::ErrorType::MalformedContainer);
}

// Test: trailing and missing bytes are both errors
TEST(Transaction, TruncatedAndTrailing) {
    expect_signer_error([] { Transaction::parse(from_hex(BIP143_UNSIGNED_TX + "00")); },
                        SignerError::ErrorType::MalformedContainer);
    expect_signer_error([] {
        Transaction::parse(from_hex(BIP143_UNSIGNED_TX.substr(0, BIP143_UNSIGNED_TX.size() - 2)));
    }, SignerError::ErrorType::MalformedContainer);
}

// Test: an input count larger than the data is rejected up front
TEST(Transaction, HugeInputCount) {
    expect_signer_error([] { Transaction::parse(from_hex("01000000" "feffffff00")); },
                        SignerError::ErrorType::MalformedContainer);
}

// Test: without witness parsing, 0x00 after the version is an empty input list
TEST(Transaction, NoWitnessModeEmptyInputs) {
    auto tx = Transaction::parse(from_hex("02000000" "00" "00" "00000000"), false);
    EXPECT_TRUE(tx.inputs.empty());
    EXPECT_TRUE(tx.outputs.empty());
}

// Test: standalone output records
TEST(Transaction, OutputRecord) {
    auto record = from_hex("0046c323000000001600141d0f172a0ecb48aee1be1f2687d2963ae33f71a1");
    auto output = signer::parse_output(record);
    EXPECT_EQ(output.amount, 600000000u);
    EXPECT_EQ(HexUtils::encode(output.script_pubkey), "00141d0f172a0ecb48aee1be1f2687d2963ae33f71a1");
    EXPECT_EQ(signer::serialize_output(output), record);

    record.push_back(0x00);
    expect_signer_error([&record] { signer::parse_output(record); },
                        SignerError::ErrorType::MalformedContainer);
}

// Test: default-constructed records start zeroed
TEST(Transaction, DefaultRecordsAreZero) {
    signer::TxIn input;
    EXPECT_EQ(input.prevout.index, 0u);
    EXPECT_EQ(input.sequence, 0u);
    EXPECT_TRUE(std::all_of(input.prevout.txid.begin(), input.prevout.txid.end(),
                            [](uint8_t b) { return b == 0; }));

    signer::TxOut output;
    EXPECT_EQ(output.amount, 0u);
    EXPECT_TRUE(output.script_pubkey.empty());
}
