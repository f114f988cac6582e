#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace signer {

// ECDSA over secp256k1 with deterministic nonces (RFC6979) and low-S output
class EcdsaSigner {
public:
    // Signs a 32-byte digest; returns the DER-encoded signature without a sighash byte
    static std::vector<uint8_t> sign(std::span<const uint8_t> privkey, std::span<const uint8_t> digest);

    // Verifies a DER signature against a serialized public key
    static bool verify(std::span<const uint8_t> pubkey, std::span<const uint8_t> digest,
                       std::span<const uint8_t> der_signature);

    // True if the DER signature's S value is at most n/2
    static bool has_low_s(std::span<const uint8_t> der_signature);

    // First RFC6979 nonce candidate for (privkey, digest), exposed for test vectors
    static std::array<uint8_t, 32> rfc6979_nonce(std::span<const uint8_t> privkey,
                                                 std::span<const uint8_t> digest);

private:
    EcdsaSigner() = delete;
};

} // namespace signer
