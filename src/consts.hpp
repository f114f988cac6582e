#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace signer {

    // Bitcoin Script Operation Codes
    constexpr uint8_t OP_0 = 0x00;
    constexpr uint8_t OP_DUP = 0x76;
    constexpr uint8_t OP_HASH160 = 0xA9;
    constexpr uint8_t OP_EQUALVERIFY = 0x88;
    constexpr uint8_t OP_CHECKSIG = 0xAC;

    // Key and script sizes
    constexpr size_t PRIVATE_KEY_SIZE = 32;
    constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;
    constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;
    constexpr size_t PUBKEY_HASH_SIZE = 20;
    constexpr size_t P2WPKH_PROGRAM_SIZE = 22;   // OP_0 <20 bytes>
    constexpr size_t P2PKH_SCRIPT_SIZE = 25;     // BIP143 scriptCode for P2WPKH
    constexpr uint8_t WITNESS_VERSION_0 = 0x00;
    constexpr uint8_t WIF_COMPRESSED_FLAG = 0x01;

    // Signature hash types
    constexpr uint32_t SIGHASH_ALL = 0x01;
    constexpr uint32_t SIGHASH_NONE = 0x02;
    constexpr uint32_t SIGHASH_SINGLE = 0x03;
    constexpr uint32_t SIGHASH_ANYONECANPAY = 0x80;
    constexpr uint32_t SIGHASH_OUTPUT_MASK = 0x1f;

    // Transaction serialization
    constexpr uint8_t TX_MARKER = 0x00;
    constexpr uint8_t TX_FLAG = 0x01;

    // PSBT container (BIP174)
    constexpr std::array<uint8_t, 5> PSBT_MAGIC_BYTES = {'p', 's', 'b', 't', 0xff};
    constexpr uint8_t PSBT_SEPARATOR = 0x00;

    constexpr uint8_t PSBT_GLOBAL_UNSIGNED_TX = 0x00;
    constexpr uint8_t PSBT_GLOBAL_VERSION = 0xFB;

    constexpr uint8_t PSBT_IN_NON_WITNESS_UTXO = 0x00;
    constexpr uint8_t PSBT_IN_WITNESS_UTXO = 0x01;
    constexpr uint8_t PSBT_IN_PARTIAL_SIG = 0x02;
    constexpr uint8_t PSBT_IN_SIGHASH = 0x03;
    constexpr uint8_t PSBT_IN_SCRIPTSIG = 0x07;
    constexpr uint8_t PSBT_IN_SCRIPTWITNESS = 0x08;

    constexpr uint32_t PSBT_HIGHEST_VERSION = 0;

} // namespace signer
