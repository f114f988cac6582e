#include "psbt.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "key_util.hpp"
#include "serialize.hpp"
#include "sighash.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>

namespace signer {

namespace {

[[noreturn]] void malformed(const std::string& message) {
    throw SignerError(SignerError::ErrorType::MalformedContainer, message);
}

// Reads key/value records up to and including the 0x00 separator
PsbtMap read_map(ByteReader& reader, const char* map_name) {
    PsbtMap map;
    std::set<std::vector<uint8_t>> seen_keys;
    while (true) {
        uint64_t key_len = reader.read_compact_size();
        if (key_len == 0) {
            break;
        }
        if (key_len > reader.remaining()) {
            malformed(std::string("Truncated key in ") + map_name + " map");
        }
        auto key_bytes = reader.read_bytes(static_cast<size_t>(key_len));
        PsbtRecord record;
        record.key.assign(key_bytes.begin(), key_bytes.end());
        record.value = reader.read_var_bytes();

        if (!seen_keys.insert(record.key).second) {
            malformed(std::string("Duplicate key in ") + map_name + " map");
        }
        map.push_back(std::move(record));
    }
    return map;
}

void require_single_byte_key(const PsbtRecord& record, const char* what) {
    if (record.key.size() != 1) {
        malformed(std::string(what) + " key is more than one byte type");
    }
}

uint32_t read_u32_value(const PsbtRecord& record, const char* what) {
    if (record.value.size() != 4) {
        malformed(std::string(what) + " value must be 4 bytes");
    }
    ByteReader reader(record.value);
    return reader.read_u32_le();
}

void parse_global(const PsbtMap& map, std::optional<Transaction>& tx) {
    for (const auto& record : map) {
        switch (record.type()) {
            case PSBT_GLOBAL_UNSIGNED_TX: {
                require_single_byte_key(record, "Global unsigned tx");
                // The unsigned transaction is always in non-witness serialization
                auto parsed = Transaction::parse(record.value, false);
                for (const auto& input : parsed.inputs) {
                    if (!input.script_sig.empty() || !input.witness.empty()) {
                        malformed("Unsigned tx does not have empty scriptSigs and scriptWitnesses");
                    }
                }
                tx = std::move(parsed);
                break;
            }
            case PSBT_GLOBAL_VERSION: {
                require_single_byte_key(record, "Global version");
                uint32_t version = read_u32_value(record, "Global version");
                if (version > PSBT_HIGHEST_VERSION) {
                    malformed("Unsupported PSBT version " + std::to_string(version));
                }
                break;
            }
            default:
                // Unknown, xpub and proprietary records are carried as-is
                break;
        }
    }
}

PsbtInput parse_input(PsbtMap map) {
    PsbtInput input;
    for (const auto& record : map) {
        switch (record.type()) {
            case PSBT_IN_NON_WITNESS_UTXO:
                require_single_byte_key(record, "Non-witness utxo");
                input.non_witness_utxo = Transaction::parse(record.value);
                break;
            case PSBT_IN_WITNESS_UTXO:
                require_single_byte_key(record, "Witness utxo");
                input.witness_utxo = parse_output(record.value);
                break;
            case PSBT_IN_PARTIAL_SIG: {
                std::span<const uint8_t> pubkey(record.key.data() + 1, record.key.size() - 1);
                if (!KeyUtil::is_public_key_encoding(pubkey)) {
                    malformed("Size of key was not the expected size for the type partial signature pubkey");
                }
                break;
            }
            case PSBT_IN_SIGHASH:
                require_single_byte_key(record, "Sighash type");
                input.sighash_type = read_u32_value(record, "Sighash type");
                break;
            case PSBT_IN_SCRIPTSIG:
                require_single_byte_key(record, "Final scriptSig");
                input.finalized = true;
                break;
            case PSBT_IN_SCRIPTWITNESS:
                require_single_byte_key(record, "Final scriptWitness");
                input.finalized = true;
                break;
            default:
                break;
        }
    }
    input.records = std::move(map);
    return input;
}

// A full previous transaction must be the one the input spends, and must agree
// with the witness UTXO record when both are present
void check_previous_outputs(const Transaction& tx, const std::vector<PsbtInput>& inputs) {
    for (size_t i = 0; i < inputs.size(); ++i) {
        const auto& input = inputs[i];
        if (!input.non_witness_utxo) {
            continue;
        }
        const auto& prevout = tx.inputs[i].prevout;
        if (input.non_witness_utxo->txid() != prevout.txid) {
            malformed("Non-witness UTXO does not match outpoint hash of input " + std::to_string(i));
        }
        if (prevout.index >= input.non_witness_utxo->outputs.size()) {
            malformed("Input " + std::to_string(i) + " spends an output the previous transaction does not have");
        }
        if (input.witness_utxo && *input.witness_utxo != input.non_witness_utxo->outputs[prevout.index]) {
            malformed("Witness UTXO disagrees with the previous transaction of input " + std::to_string(i));
        }
    }
}

void write_map(ByteWriter& writer, const PsbtMap& map) {
    for (const auto& record : map) {
        writer.write_var_bytes(record.key);
        writer.write_var_bytes(record.value);
    }
    writer.write_u8(PSBT_SEPARATOR);
}

std::vector<uint8_t> partial_sig_key(std::span<const uint8_t> pubkey) {
    std::vector<uint8_t> key;
    key.reserve(pubkey.size() + 1);
    key.push_back(PSBT_IN_PARTIAL_SIG);
    key.insert(key.end(), pubkey.begin(), pubkey.end());
    return key;
}

const char* state_name(Psbt::State state) {
    switch (state) {
        case Psbt::State::Parsed:     return "parsed";
        case Psbt::State::Signed:     return "signed";
        case Psbt::State::Serialized: return "serialized";
    }
    return "unknown";
}

} // namespace

// Parse a PSBT container
//
// PSBT structure:
// - [5 bytes] : Magic "psbt" 0xFF
// - Global map, terminated by 0x00
// - One map per unsigned tx input, each terminated by 0x00
// - One map per unsigned tx output, each terminated by 0x00
//
// Each record is [CompactSize key length] [key: type byte + key data]
//                [CompactSize value length] [value]
Psbt Psbt::parse(std::span<const uint8_t> bytes) {
    ByteReader reader(bytes);
    if (bytes.size() < PSBT_MAGIC_BYTES.size() ||
        !std::equal(PSBT_MAGIC_BYTES.begin(), PSBT_MAGIC_BYTES.end(), bytes.begin())) {
        malformed("Invalid PSBT magic bytes");
    }
    reader.read_bytes(PSBT_MAGIC_BYTES.size());

    Psbt psbt;
    psbt.global_ = read_map(reader, "global");

    std::optional<Transaction> tx;
    parse_global(psbt.global_, tx);
    if (!tx) {
        malformed("No unsigned transaction was provided");
    }
    psbt.tx_ = std::move(*tx);

    psbt.inputs_.reserve(psbt.tx_.inputs.size());
    for (size_t i = 0; i < psbt.tx_.inputs.size(); ++i) {
        if (reader.empty()) {
            malformed("Inputs provided does not match the number of inputs in transaction");
        }
        psbt.inputs_.push_back(parse_input(read_map(reader, "input")));
    }

    psbt.outputs_.reserve(psbt.tx_.outputs.size());
    for (size_t i = 0; i < psbt.tx_.outputs.size(); ++i) {
        if (reader.empty()) {
            malformed("Outputs provided does not match the number of outputs in transaction");
        }
        psbt.outputs_.push_back(read_map(reader, "output"));
    }

    if (!reader.empty()) {
        malformed("Trailing bytes after PSBT");
    }

    check_previous_outputs(psbt.tx_, psbt.inputs_);
    return psbt;
}

std::vector<uint8_t> Psbt::serialize() {
    if (state_ == State::Serialized) {
        throw std::logic_error("Psbt::serialize called on an already serialized container");
    }

    ByteWriter writer;
    writer.write_bytes(PSBT_MAGIC_BYTES);
    write_map(writer, global_);
    for (const auto& input : inputs_) {
        write_map(writer, input.records);
    }
    for (const auto& output : outputs_) {
        write_map(writer, output);
    }

    state_ = State::Serialized;
    return writer.take();
}

const PsbtInput& Psbt::input(size_t index) const {
    if (index >= inputs_.size()) {
        throw std::out_of_range("PSBT input index out of range");
    }
    return inputs_[index];
}

const PsbtMap& Psbt::output_map(size_t index) const {
    if (index >= outputs_.size()) {
        throw std::out_of_range("PSBT output index out of range");
    }
    return outputs_[index];
}

std::optional<TxOut> Psbt::spent_output(size_t index) const {
    const auto& entry = input(index);
    if (entry.non_witness_utxo) {
        return entry.non_witness_utxo->outputs[tx_.inputs[index].prevout.index];
    }
    return entry.witness_utxo;
}

uint32_t Psbt::sighash_type(size_t index) const {
    const auto& entry = input(index);
    if (!entry.sighash_type) {
        return SIGHASH_ALL;
    }
    if (!SignatureHash::is_supported_type(*entry.sighash_type)) {
        malformed("Unsupported sighash type on input " + std::to_string(index));
    }
    return *entry.sighash_type;
}

bool Psbt::is_finalized(size_t index) const {
    return input(index).finalized;
}

bool Psbt::has_partial_signature(size_t index, std::span<const uint8_t> pubkey) const {
    auto key = partial_sig_key(pubkey);
    const auto& records = input(index).records;
    return std::any_of(records.begin(), records.end(),
        [&key](const PsbtRecord& record) { return record.key == key; });
}

void Psbt::add_partial_signature(size_t index, std::span<const uint8_t> pubkey,
                                 std::span<const uint8_t> signature) {
    require_state(State::Parsed, "add_partial_signature");
    if (!KeyUtil::is_public_key_encoding(pubkey)) {
        throw std::invalid_argument("Partial signature key must be a serialized public key");
    }
    if (has_partial_signature(index, pubkey)) {
        throw std::logic_error("Input already holds a partial signature for this public key");
    }

    PsbtRecord record;
    record.key = partial_sig_key(pubkey);
    record.value.assign(signature.begin(), signature.end());
    inputs_[index].records.push_back(std::move(record));
}

void Psbt::mark_signed() {
    require_state(State::Parsed, "mark_signed");
    state_ = State::Signed;
}

void Psbt::require_state(State expected, const char* operation) const {
    if (state_ != expected) {
        throw std::logic_error(std::string("Psbt::") + operation + " called on a " +
                               state_name(state_) + " container");
    }
}

} // namespace signer
