#include "hash_utils.hpp"
#include "error.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace signer {

// Computes the SHA256 hash of input data.
// SHA256 produces a fixed-size 32-byte output and is the building block of
// every other digest in this file: txids, checksums, sighashes and HASH160.
HashUtils::Sha256Digest HashUtils::sha256(std::span<const uint8_t> data) {
    Sha256Digest hash;
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash.data(), &sha256);
    return hash;
}

// Computes double SHA256 hash (SHA256(SHA256(data)))
// Used for Base58Check checksums, transaction ids and the BIP143 preimage.
HashUtils::Sha256Digest HashUtils::double_sha256(std::span<const uint8_t> data) {
    auto first_hash = sha256(data);
    return sha256(std::span<const uint8_t>(first_hash.data(), first_hash.size()));
}

HashUtils::Hash160Digest HashUtils::ripemd160(std::span<const uint8_t> data) {
    Hash160Digest hash;
    RIPEMD160_CTX ripemd160;
    RIPEMD160_Init(&ripemd160);
    RIPEMD160_Update(&ripemd160, data.data(), data.size());
    RIPEMD160_Final(hash.data(), &ripemd160);
    return hash;
}

// Computes HASH160 (RIPEMD160(SHA256(data)))
// This is the 20-byte public key hash committed to by a P2WPKH witness program.
HashUtils::Hash160Digest HashUtils::hash160(std::span<const uint8_t> data) {
    auto sha256_result = sha256(data);
    return ripemd160(std::span<const uint8_t>(sha256_result.data(), sha256_result.size()));
}

HashUtils::Sha256Digest HashUtils::hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data) {
    Sha256Digest mac;
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), mac.data(), &mac_len) ||
        mac_len != mac.size()) {
        throw SignerError(SignerError::ErrorType::CryptoFailure, "HMAC-SHA256 failed");
    }
    return mac;
}

} // namespace signer
