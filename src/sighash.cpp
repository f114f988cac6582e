#include "sighash.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "serialize.hpp"

namespace signer {

namespace {

using Hash256 = std::array<uint8_t, 32>;

Hash256 hash_prevouts(const Transaction& tx) {
    ByteWriter writer;
    for (const auto& input : tx.inputs) {
        writer.write_bytes(input.prevout.txid);
        writer.write_u32_le(input.prevout.index);
    }
    return HashUtils::double_sha256(writer.data());
}

Hash256 hash_sequence(const Transaction& tx) {
    ByteWriter writer;
    for (const auto& input : tx.inputs) {
        writer.write_u32_le(input.sequence);
    }
    return HashUtils::double_sha256(writer.data());
}

Hash256 hash_outputs(std::span<const TxOut> outputs) {
    ByteWriter writer;
    for (const auto& output : outputs) {
        writer.write_u64_le(output.amount);
        writer.write_var_bytes(output.script_pubkey);
    }
    return HashUtils::double_sha256(writer.data());
}

} // namespace

// Create the transaction digest (hash) for signing according to BIP143
// https://github.com/bitcoin/bips/blob/master/bip-0143.mediawiki
//
// The commitment structure includes:
// 1. Transaction version (4 bytes)
// 2. hashPrevouts (32 bytes): double SHA256 of all input outpoints,
//    zero with ANYONECANPAY
// 3. hashSequence (32 bytes): double SHA256 of all input sequence numbers,
//    zero with ANYONECANPAY, SINGLE or NONE
// 4. Outpoint being spent (36 bytes)
// 5. Script code of the input (varint length + script)
// 6. Value of the output being spent (8 bytes)
// 7. Sequence number of the input (4 bytes)
// 8. hashOutputs (32 bytes): double SHA256 of all outputs for ALL, of the
//    output with the same index for SINGLE, zero otherwise
// 9. Locktime (4 bytes)
// 10. Sighash type (4 bytes)
std::array<uint8_t, 32> SignatureHash::bip143(const Transaction& tx,
                                              size_t input_index,
                                              std::span<const uint8_t> script_code,
                                              uint64_t amount,
                                              uint32_t sighash_type) {
    if (input_index >= tx.inputs.size()) {
        throw SignerError(SignerError::ErrorType::MalformedContainer,
            "Input index out of range for signature hash");
    }

    const bool anyone_can_pay = (sighash_type & SIGHASH_ANYONECANPAY) != 0;
    const uint32_t base_type = sighash_type & SIGHASH_OUTPUT_MASK;
    const Hash256 zero{};

    Hash256 prevouts = anyone_can_pay ? zero : hash_prevouts(tx);
    Hash256 sequences = (anyone_can_pay || base_type == SIGHASH_SINGLE || base_type == SIGHASH_NONE)
        ? zero : hash_sequence(tx);

    Hash256 outputs = zero;
    if (base_type != SIGHASH_SINGLE && base_type != SIGHASH_NONE) {
        outputs = hash_outputs(tx.outputs);
    } else if (base_type == SIGHASH_SINGLE && input_index < tx.outputs.size()) {
        outputs = hash_outputs(std::span<const TxOut>(&tx.outputs[input_index], 1));
    }

    const auto& input = tx.inputs[input_index];

    ByteWriter commitment;
    commitment.write_u32_le(tx.version);
    commitment.write_bytes(prevouts);
    commitment.write_bytes(sequences);
    commitment.write_bytes(input.prevout.txid);
    commitment.write_u32_le(input.prevout.index);
    commitment.write_var_bytes(script_code);
    commitment.write_u64_le(amount);
    commitment.write_u32_le(input.sequence);
    commitment.write_bytes(outputs);
    commitment.write_u32_le(tx.locktime);
    commitment.write_u32_le(sighash_type);

    return HashUtils::double_sha256(commitment.data());
}

bool SignatureHash::is_supported_type(uint32_t sighash_type) {
    const uint32_t base_type = sighash_type & ~SIGHASH_ANYONECANPAY;
    return base_type == SIGHASH_ALL || base_type == SIGHASH_NONE || base_type == SIGHASH_SINGLE;
}

} // namespace signer
