#include "transaction.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "serialize.hpp"
#include <algorithm>
#include <string>

namespace signer {

namespace {

// Every input needs at least 41 bytes and every output at least 9, so counts
// larger than the remaining data are rejected before any allocation.
void check_count(uint64_t count, size_t min_item_size, const ByteReader& reader, const char* what) {
    if (count > reader.remaining() / min_item_size) {
        throw SignerError(SignerError::ErrorType::MalformedContainer,
            std::string("Transaction ") + what + " count exceeds available data");
    }
}

std::vector<TxIn> read_inputs(ByteReader& reader) {
    uint64_t count = reader.read_compact_size();
    check_count(count, 41, reader, "input");

    std::vector<TxIn> inputs;
    inputs.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        TxIn input;
        auto txid = reader.read_bytes(32);
        std::copy(txid.begin(), txid.end(), input.prevout.txid.begin());
        input.prevout.index = reader.read_u32_le();
        input.script_sig = reader.read_var_bytes();
        input.sequence = reader.read_u32_le();
        inputs.push_back(std::move(input));
    }
    return inputs;
}

std::vector<TxOut> read_outputs(ByteReader& reader) {
    uint64_t count = reader.read_compact_size();
    check_count(count, 9, reader, "output");

    std::vector<TxOut> outputs;
    outputs.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        TxOut output;
        output.amount = reader.read_u64_le();
        output.script_pubkey = reader.read_var_bytes();
        outputs.push_back(std::move(output));
    }
    return outputs;
}

void write_output(ByteWriter& writer, const TxOut& output) {
    writer.write_u64_le(output.amount);
    writer.write_var_bytes(output.script_pubkey);
}

} // namespace

// Parse a bitcoin transaction in legacy or BIP144 form
// https://github.com/bitcoin/bips/blob/master/bip-0144.mediawiki
//
// SegWit transaction structure:
// 1. Transaction version (4 bytes)
// 2. Marker (1 byte, 0x00) and flag (1 byte, 0x01), segwit only
// 3. Input count (varint) and inputs
// 4. Output count (varint) and outputs
// 5. Witness stacks, one per input, segwit only
// 6. Locktime (4 bytes)
Transaction Transaction::parse(std::span<const uint8_t> bytes, bool allow_witness) {
    ByteReader reader(bytes);
    Transaction tx;
    tx.version = reader.read_u32_le();

    bool segwit = false;
    if (allow_witness && reader.peek_u8() == TX_MARKER) {
        reader.read_u8();
        if (reader.read_u8() != TX_FLAG) {
            throw SignerError(SignerError::ErrorType::MalformedContainer,
                "Unknown transaction serialization flag");
        }
        segwit = true;
    }

    tx.inputs = read_inputs(reader);
    tx.outputs = read_outputs(reader);

    if (segwit) {
        for (auto& input : tx.inputs) {
            uint64_t items = reader.read_compact_size();
            check_count(items, 1, reader, "witness item");
            input.witness.reserve(static_cast<size_t>(items));
            for (uint64_t i = 0; i < items; ++i) {
                input.witness.push_back(reader.read_var_bytes());
            }
        }
        if (!tx.has_witness()) {
            throw SignerError(SignerError::ErrorType::MalformedContainer,
                "Superfluous witness record");
        }
    }

    tx.locktime = reader.read_u32_le();

    if (!reader.empty()) {
        throw SignerError(SignerError::ErrorType::MalformedContainer,
            "Trailing bytes after transaction");
    }
    return tx;
}

std::vector<uint8_t> Transaction::serialize(bool include_witness) const {
    bool segwit = include_witness && has_witness();

    ByteWriter writer;
    writer.write_u32_le(version);
    if (segwit) {
        writer.write_u8(TX_MARKER);
        writer.write_u8(TX_FLAG);
    }

    // Transaction input structure:
    // - [32 bytes]: Previous transaction ID (little-endian)
    // - [4 bytes] : Previous output index (little-endian)
    // - [varint]  : scriptSig length and scriptSig
    // - [4 bytes] : Sequence number
    writer.write_compact_size(inputs.size());
    for (const auto& input : inputs) {
        writer.write_bytes(input.prevout.txid);
        writer.write_u32_le(input.prevout.index);
        writer.write_var_bytes(input.script_sig);
        writer.write_u32_le(input.sequence);
    }

    writer.write_compact_size(outputs.size());
    for (const auto& output : outputs) {
        write_output(writer, output);
    }

    if (segwit) {
        for (const auto& input : inputs) {
            writer.write_compact_size(input.witness.size());
            for (const auto& item : input.witness) {
                writer.write_var_bytes(item);
            }
        }
    }

    writer.write_u32_le(locktime);
    return writer.take();
}

bool Transaction::has_witness() const {
    return std::any_of(inputs.begin(), inputs.end(),
        [](const TxIn& input) { return !input.witness.empty(); });
}

// Calculate the transaction ID (txid) for a transaction
// The txid is the double SHA256 hash of the transaction data, excluding witness data,
// so it does not change when signatures are added to the witness.
std::array<uint8_t, 32> Transaction::txid() const {
    return HashUtils::double_sha256(serialize(false));
}

std::vector<uint8_t> serialize_output(const TxOut& output) {
    ByteWriter writer;
    write_output(writer, output);
    return writer.take();
}

TxOut parse_output(std::span<const uint8_t> bytes) {
    ByteReader reader(bytes);
    TxOut output;
    output.amount = reader.read_u64_le();
    output.script_pubkey = reader.read_var_bytes();
    if (!reader.empty()) {
        throw SignerError(SignerError::ErrorType::MalformedContainer,
            "Trailing bytes after transaction output");
    }
    return output;
}

} // namespace signer
