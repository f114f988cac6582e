#pragma once

#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include "network.hpp"

namespace signer {

class Segwit {
public:
    // Get the P2WPKH witness program (scriptPubKey) for a compressed public key
    static std::vector<uint8_t> get_p2wpkh_program(std::span<const uint8_t> pubkey);

    // Get the P2WPKH witness program for a 20-byte public key hash
    static std::vector<uint8_t> get_p2wpkh_program_from_hash(std::span<const uint8_t> pubkey_hash);

    // True if script is exactly OP_0 <20 bytes>
    static bool is_p2wpkh_program(std::span<const uint8_t> script);

    // Get the BIP143 P2WPKH script code for a public key hash (without length prefix)
    static std::vector<uint8_t> get_p2wpkh_scriptcode(std::span<const uint8_t> pubkey_hash);

    // Encode the bech32 P2WPKH address of a compressed public key
    static std::string encode_p2wpkh_address(std::span<const uint8_t> pubkey, Network network);

private:
    Segwit() = delete;
};

} // namespace signer
