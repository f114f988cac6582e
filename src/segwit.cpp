#include "segwit.hpp"
#include "bech32.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "key_util.hpp"

namespace signer {

namespace {

void require_compressed_pubkey(std::span<const uint8_t> pubkey) {
    if (pubkey.size() != COMPRESSED_PUBKEY_SIZE || !KeyUtil::is_public_key_encoding(pubkey)) {
        throw SignerError(SignerError::ErrorType::EncodingFailure,
            "P2WPKH requires a 33-byte compressed public key");
    }
}

} // namespace

// Create a Pay-to-Witness-Public-Key-Hash (P2WPKH) program from a public key
// This implements the standard P2WPKH witness program as defined in BIP141
// https://github.com/bitcoin/bips/blob/master/bip-0141.mediawiki
//
// The process:
// 1. Compute SHA256 of the public key
// 2. Compute RIPEMD160 of the SHA256 hash (this is the HASH160 algorithm)
// 3. Create witness program: [version byte] [push byte] [20-byte hash]
//
// P2WPKH structure (22 bytes total):
// - 0x00     : Witness version 0
// - 0x14     : Push 20 bytes
// - [20 bytes]: HASH160 of public key
std::vector<uint8_t> Segwit::get_p2wpkh_program(std::span<const uint8_t> pubkey) {
    require_compressed_pubkey(pubkey);
    auto hash160_result = HashUtils::hash160(pubkey);
    return get_p2wpkh_program_from_hash(hash160_result);
}

std::vector<uint8_t> Segwit::get_p2wpkh_program_from_hash(std::span<const uint8_t> pubkey_hash) {
    if (pubkey_hash.size() != PUBKEY_HASH_SIZE) {
        throw SignerError(SignerError::ErrorType::EncodingFailure, "Public key hash must be 20 bytes");
    }

    std::vector<uint8_t> program;
    program.reserve(P2WPKH_PROGRAM_SIZE);
    program.push_back(OP_0);
    program.push_back(static_cast<uint8_t>(PUBKEY_HASH_SIZE));
    program.insert(program.end(), pubkey_hash.begin(), pubkey_hash.end());
    return program;
}

bool Segwit::is_p2wpkh_program(std::span<const uint8_t> script) {
    return script.size() == P2WPKH_PROGRAM_SIZE &&
           script[0] == OP_0 &&
           script[1] == PUBKEY_HASH_SIZE;
}

// Assemble the P2WPKH scriptCode as defined in BIP143
// https://github.com/bitcoin/bips/blob/master/bip-0143.mediawiki#specification
//
// For P2WPKH, the scriptCode is a standard P2PKH script:
// OP_DUP OP_HASH160 <pubkey hash> OP_EQUALVERIFY OP_CHECKSIG
//
// P2WPKH scriptcode structure (25 bytes; the sighash serializer adds the 0x19 length):
// - 0x76     : OP_DUP
// - 0xA9     : OP_HASH160
// - 0x14     : Push 20 bytes
// - [20 bytes]: Public key hash (from witness program)
// - 0x88     : OP_EQUALVERIFY
// - 0xAC     : OP_CHECKSIG
std::vector<uint8_t> Segwit::get_p2wpkh_scriptcode(std::span<const uint8_t> pubkey_hash) {
    if (pubkey_hash.size() != PUBKEY_HASH_SIZE) {
        throw SignerError(SignerError::ErrorType::EncodingFailure, "Public key hash must be 20 bytes");
    }

    std::vector<uint8_t> script;
    script.reserve(P2PKH_SCRIPT_SIZE);
    script.push_back(OP_DUP);
    script.push_back(OP_HASH160);
    script.push_back(static_cast<uint8_t>(PUBKEY_HASH_SIZE));
    script.insert(script.end(), pubkey_hash.begin(), pubkey_hash.end());
    script.push_back(OP_EQUALVERIFY);
    script.push_back(OP_CHECKSIG);
    return script;
}

// Encode a P2WPKH address: bech32(hrp, [0] || to5bit(HASH160(pubkey)))
// e.g. bc1q... on mainnet and tb1q... on testnet, always 42 characters
std::string Segwit::encode_p2wpkh_address(std::span<const uint8_t> pubkey, Network network) {
    require_compressed_pubkey(pubkey);
    auto hash160_result = HashUtils::hash160(pubkey);
    return SegwitAddress::encode(network_params(network).bech32_hrp, WITNESS_VERSION_0, hash160_result);
}

} // namespace signer
