#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "secure_memory.hpp"

namespace signer {

// A secp256k1 private key held in wiped, page-locked memory.
// Move-only; the scalar is validated on construction.
class PrivateKey {
public:
    // Throws SignerError(InvalidPrivateKey) unless bytes is a valid scalar
    explicit PrivateKey(std::span<const uint8_t> bytes, bool compressed = true);

    PrivateKey(PrivateKey&&) noexcept = default;
    PrivateKey& operator=(PrivateKey&&) noexcept = default;

    std::span<const uint8_t> bytes() const { return secret_.bytes(); }

    // Whether the key was imported with the compression flag. P2WPKH always
    // uses the compressed public key regardless.
    bool compressed() const { return compressed_; }

    // 33-byte compressed public key
    std::vector<uint8_t> public_key() const;

private:
    SecureMemory secret_;
    bool compressed_;
};

} // namespace signer
