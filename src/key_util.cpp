#include "key_util.hpp"
#include "consts.hpp"
#include "error.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <memory>

namespace signer {

namespace {

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using GroupPtr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

GroupPtr secp256k1_group() {
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free);
    if (!group) {
        throw SignerError(SignerError::ErrorType::CryptoFailure, "secp256k1 group unavailable");
    }
    return group;
}

} // namespace

bool KeyUtil::is_valid_private_key(std::span<const uint8_t> key) {
    if (key.size() != PRIVATE_KEY_SIZE) {
        return false;
    }

    auto group = secp256k1_group();
    BignumPtr scalar(BN_bin2bn(key.data(), static_cast<int>(key.size()), nullptr), BN_clear_free);
    if (!scalar) {
        throw SignerError(SignerError::ErrorType::CryptoFailure, "BN_bin2bn failed");
    }

    // The group order n of secp256k1:
    // FFFFFFFF FFFFFFFF FFFFFFFF FFFFFFFE BAAEDCE6 AF48A03B BFD25E8C D0364141
    const BIGNUM* order = EC_GROUP_get0_order(group.get());
    return !BN_is_zero(scalar.get()) && BN_cmp(scalar.get(), order) < 0;
}

// Derives a public key from a private key using elliptic curve multiplication
// This implements the secp256k1 curve operation: public_key = private_key * G
// where G is the generator point of the curve.
//
// The process:
// 1. Load the secp256k1 group parameters
// 2. Convert the private key bytes to a BIGNUM
// 3. Perform the scalar multiplication (private_key * G)
// 4. Serialize the resulting point in compressed format (33 bytes)
//
// Compressed public key format:
// - First byte: 0x02 if y-coordinate is even, 0x03 if y-coordinate is odd
// - Remaining 32 bytes: x-coordinate
std::vector<uint8_t> KeyUtil::derive_public_key(std::span<const uint8_t> key) {
    if (!is_valid_private_key(key)) {
        throw SignerError(SignerError::ErrorType::InvalidPrivateKey,
            "Private key must be 32 bytes in range [1, n-1]");
    }

    auto group = secp256k1_group();
    BignumPtr priv_key(BN_bin2bn(key.data(), static_cast<int>(key.size()), nullptr), BN_clear_free);
    if (!priv_key) {
        throw SignerError(SignerError::ErrorType::CryptoFailure, "BN_bin2bn failed");
    }
    BN_set_flags(priv_key.get(), BN_FLG_CONSTTIME);

    PointPtr pub_key(EC_POINT_new(group.get()), EC_POINT_free);
    if (!pub_key || !EC_POINT_mul(group.get(), pub_key.get(), priv_key.get(), nullptr, nullptr, nullptr)) {
        throw SignerError(SignerError::ErrorType::CryptoFailure, "EC point multiplication failed");
    }

    std::vector<uint8_t> result(COMPRESSED_PUBKEY_SIZE);
    size_t size = EC_POINT_point2oct(
        group.get(), pub_key.get(), POINT_CONVERSION_COMPRESSED,
        result.data(), result.size(), nullptr
    );
    if (size != COMPRESSED_PUBKEY_SIZE) {
        throw SignerError(SignerError::ErrorType::CryptoFailure, "Public key serialization failed");
    }

    return result;
}

bool KeyUtil::is_public_key_encoding(std::span<const uint8_t> pubkey) {
    if (pubkey.size() == COMPRESSED_PUBKEY_SIZE) {
        return pubkey[0] == 0x02 || pubkey[0] == 0x03;
    }
    if (pubkey.size() == UNCOMPRESSED_PUBKEY_SIZE) {
        return pubkey[0] == 0x04;
    }
    return false;
}

} // namespace signer
