#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "transaction.hpp"

namespace signer {

// One key/value record of a PSBT map. The key keeps its type byte so that
// records round-trip byte for byte.
struct PsbtRecord {
    std::vector<uint8_t> key;
    std::vector<uint8_t> value;

    uint8_t type() const { return key[0]; }
};

// Records in the order they were read; the separator is implied
using PsbtMap = std::vector<PsbtRecord>;

// Decoded view of the input fields the signer needs, next to the raw map
struct PsbtInput {
    PsbtMap records;
    std::optional<Transaction> non_witness_utxo;
    std::optional<TxOut> witness_utxo;
    std::optional<uint32_t> sighash_type;
    bool finalized = false;
};

// Partially Signed Bitcoin Transaction, version 0 (BIP174)
// https://github.com/bitcoin/bips/blob/master/bip-0174.mediawiki
//
// A container goes through Parsed -> Signed -> Serialized, never backwards.
// Signatures may only be added while Parsed; serialize() may be called once.
// Calls out of order throw std::logic_error.
class Psbt {
public:
    enum class State {
        Parsed,
        Signed,
        Serialized
    };

    // Throws SignerError(MalformedContainer) on any structural error
    static Psbt parse(std::span<const uint8_t> bytes);

    // Re-encodes every map in its original order. Records the signer did not
    // add come out exactly as they were read.
    std::vector<uint8_t> serialize();

    State state() const { return state_; }
    const Transaction& unsigned_tx() const { return tx_; }
    size_t input_count() const { return inputs_.size(); }
    size_t output_count() const { return outputs_.size(); }

    const PsbtMap& global_map() const { return global_; }
    const PsbtInput& input(size_t index) const;
    const PsbtMap& output_map(size_t index) const;

    // The output spent by input `index`, from the full previous transaction
    // or the witness UTXO record; nullopt if the input carries neither
    std::optional<TxOut> spent_output(size_t index) const;

    // The input's sighash type, SIGHASH_ALL when absent.
    // Throws SignerError(MalformedContainer) for types BIP143 signing does not support.
    uint32_t sighash_type(size_t index) const;

    // True if the input carries a final scriptSig or scriptWitness
    bool is_finalized(size_t index) const;

    bool has_partial_signature(size_t index, std::span<const uint8_t> pubkey) const;

    // Appends a PSBT_IN_PARTIAL_SIG record to the end of the input map.
    // An existing signature for the same public key is never replaced.
    void add_partial_signature(size_t index, std::span<const uint8_t> pubkey,
                               std::span<const uint8_t> signature);

    // Closes the signing phase
    void mark_signed();

private:
    Psbt() = default;

    void require_state(State expected, const char* operation) const;

    PsbtMap global_;
    Transaction tx_;
    std::vector<PsbtInput> inputs_;
    std::vector<PsbtMap> outputs_;
    State state_ = State::Parsed;
};

} // namespace signer
