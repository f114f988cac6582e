#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace signer {

struct Outpoint {
    std::array<uint8_t, 32> txid{}; // Transaction ID as bytes in little-endian (internal order)
    uint32_t index = 0;             // Output index in transaction
};

struct TxIn {
    Outpoint prevout;
    std::vector<uint8_t> script_sig;
    uint32_t sequence = 0;
    std::vector<std::vector<uint8_t>> witness; // Witness stack items
};

struct TxOut {
    uint64_t amount = 0;                // Amount in satoshis
    std::vector<uint8_t> script_pubkey; // Locking script

    bool operator==(const TxOut&) const = default;
};

struct Transaction {
    uint32_t version = 0;
    std::vector<TxIn> inputs;
    std::vector<TxOut> outputs;
    uint32_t locktime = 0;

    // Parses a serialized transaction. With allow_witness=false a 0x00 byte
    // after the version is an empty input count, not the segwit marker.
    // Throws SignerError(MalformedContainer), including on trailing bytes.
    static Transaction parse(std::span<const uint8_t> bytes, bool allow_witness = true);

    std::vector<uint8_t> serialize(bool include_witness = true) const;

    bool has_witness() const;

    // Double SHA256 of the non-witness serialization, internal byte order
    std::array<uint8_t, 32> txid() const;
};

// Serializes a transaction output: [8 bytes value LE] [CompactSize script length] [script]
std::vector<uint8_t> serialize_output(const TxOut& output);

// Parses a standalone serialized output (the PSBT witness UTXO record)
TxOut parse_output(std::span<const uint8_t> bytes);

} // namespace signer
