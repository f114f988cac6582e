#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace signer {

// Utility class for secp256k1 key operations
class KeyUtil {
public:
    // True if key is 32 bytes and 0 < key < curve order
    static bool is_valid_private_key(std::span<const uint8_t> key);

    // Derives the 33-byte compressed public key from a private key
    static std::vector<uint8_t> derive_public_key(std::span<const uint8_t> key);

    // Structural check for a serialized public key (33 bytes 02/03, or 65 bytes 04)
    static bool is_public_key_encoding(std::span<const uint8_t> pubkey);

private:
    KeyUtil() = delete;
};

} // namespace signer
