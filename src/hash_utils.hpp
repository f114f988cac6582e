#pragma once

#include <array>
#include <vector>
#include <span>
#include <cstdint>
#include <openssl/sha.h>
#include <openssl/ripemd.h>

namespace signer {

// HashUtils is a utility class for the cryptographic hash functions
// used by bitcoin keys, addresses and signature hashes
class HashUtils {
public:
    using Sha256Digest = std::array<uint8_t, SHA256_DIGEST_LENGTH>;
    using Hash160Digest = std::array<uint8_t, RIPEMD160_DIGEST_LENGTH>;

    // Computes the SHA256 hash of input data
    static Sha256Digest sha256(std::span<const uint8_t> data);

    // Computes double SHA256 hash (SHA256(SHA256(data)))
    static Sha256Digest double_sha256(std::span<const uint8_t> data);

    // Computes RIPEMD160 hash of input data
    static Hash160Digest ripemd160(std::span<const uint8_t> data);

    // Computes HASH160 (RIPEMD160(SHA256(data)))
    static Hash160Digest hash160(std::span<const uint8_t> data);

    // Computes HMAC-SHA256 of data under key
    static Sha256Digest hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data);

private:
    HashUtils() = delete;
};

} // namespace signer
