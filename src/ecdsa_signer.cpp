#include "ecdsa_signer.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <memory>

namespace signer {

namespace {

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using EcKeyPtr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using SigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

constexpr size_t DIGEST_SIZE = 32;

// The probability of needing a second nonce is about 2^-128
constexpr int MAX_NONCE_ATTEMPTS = 16;

[[noreturn]] void crypto_failure(const char* what) {
    throw SignerError(SignerError::ErrorType::CryptoFailure, what);
}

BignumPtr new_bignum() {
    BignumPtr bn(BN_new(), BN_clear_free);
    if (!bn) {
        crypto_failure("BN_new failed");
    }
    return bn;
}

BignumPtr bignum_from_bytes(std::span<const uint8_t> bytes) {
    BignumPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr), BN_clear_free);
    if (!bn) {
        crypto_failure("BN_bin2bn failed");
    }
    return bn;
}

EcKeyPtr new_secp256k1_key() {
    EcKeyPtr eckey(EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free);
    if (!eckey) {
        crypto_failure("EC_KEY_new_by_curve_name failed");
    }
    return eckey;
}

// HMAC-DRBG from RFC6979 section 3.2, instantiated with HMAC-SHA256.
// Successive calls to next() yield the candidate sequence of step h.
class Rfc6979Nonce {
public:
    Rfc6979Nonce(std::span<const uint8_t> privkey, std::span<const uint8_t> reduced_digest) {
        k_.fill(0x00);
        v_.fill(0x01);
        update(0x00, privkey, reduced_digest);
        update(0x01, privkey, reduced_digest);
    }

    ~Rfc6979Nonce() {
        OPENSSL_cleanse(k_.data(), k_.size());
        OPENSSL_cleanse(v_.data(), v_.size());
    }

    Rfc6979Nonce(const Rfc6979Nonce&) = delete;
    Rfc6979Nonce& operator=(const Rfc6979Nonce&) = delete;

    std::array<uint8_t, 32> next() {
        if (!first_) {
            update(0x00, {}, {});
        }
        first_ = false;
        v_ = HashUtils::hmac_sha256(k_, v_);
        return v_;
    }

private:
    // K = HMAC_K(V || marker || extra...); V = HMAC_K(V)
    void update(uint8_t marker, std::span<const uint8_t> key, std::span<const uint8_t> msg) {
        std::vector<uint8_t> data;
        data.reserve(v_.size() + 1 + key.size() + msg.size());
        data.insert(data.end(), v_.begin(), v_.end());
        data.push_back(marker);
        data.insert(data.end(), key.begin(), key.end());
        data.insert(data.end(), msg.begin(), msg.end());
        k_ = HashUtils::hmac_sha256(k_, data);
        OPENSSL_cleanse(data.data(), data.size());
        v_ = HashUtils::hmac_sha256(k_, v_);
    }

    std::array<uint8_t, 32> k_;
    std::array<uint8_t, 32> v_;
    bool first_ = true;
};

// bits2octets(digest): the digest as an integer reduced mod n, 32 bytes big-endian
std::array<uint8_t, 32> reduce_digest(std::span<const uint8_t> digest, const BIGNUM* order, BN_CTX* ctx) {
    auto value = bignum_from_bytes(digest);
    auto reduced = new_bignum();
    std::array<uint8_t, 32> out;
    if (!BN_nnmod(reduced.get(), value.get(), order, ctx) ||
        BN_bn2binpad(reduced.get(), out.data(), static_cast<int>(out.size())) != static_cast<int>(out.size())) {
        crypto_failure("Digest reduction failed");
    }
    return out;
}

void check_inputs(std::span<const uint8_t> privkey, std::span<const uint8_t> digest) {
    if (privkey.size() != PRIVATE_KEY_SIZE) {
        throw SignerError(SignerError::ErrorType::InvalidPrivateKey, "Private key must be 32 bytes");
    }
    if (digest.size() != DIGEST_SIZE) {
        throw SignerError(SignerError::ErrorType::InvalidLength, "Signature digest must be 32 bytes");
    }
}

// If S > n/2, replace S with n - S (BIP62 low-S rule)
void normalize_low_s(ECDSA_SIG* sig, const BIGNUM* order) {
    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig, &r, &s);

    auto half_order = new_bignum();
    if (!BN_rshift1(half_order.get(), order)) {
        crypto_failure("BN_rshift1 failed");
    }
    if (BN_cmp(s, half_order.get()) <= 0) {
        return;
    }

    auto new_s = new_bignum();
    if (!BN_sub(new_s.get(), order, s)) {
        crypto_failure("BN_sub failed");
    }
    BignumPtr new_r(BN_dup(r), BN_clear_free);
    if (!new_r) {
        crypto_failure("BN_dup failed");
    }
    // ECDSA_SIG_set0 takes ownership of both values on success
    if (ECDSA_SIG_set0(sig, new_r.get(), new_s.get()) != 1) {
        crypto_failure("ECDSA_SIG_set0 failed");
    }
    new_r.release();
    new_s.release();
}

} // namespace

std::array<uint8_t, 32> EcdsaSigner::rfc6979_nonce(std::span<const uint8_t> privkey,
                                                   std::span<const uint8_t> digest) {
    check_inputs(privkey, digest);
    auto eckey = new_secp256k1_key();
    const BIGNUM* order = EC_GROUP_get0_order(EC_KEY_get0_group(eckey.get()));
    BnCtxPtr ctx(BN_CTX_new(), BN_CTX_free);
    if (!ctx) {
        crypto_failure("BN_CTX_new failed");
    }
    auto reduced = reduce_digest(digest, order, ctx.get());
    Rfc6979Nonce nonce(privkey, reduced);
    return nonce.next();
}

// Sign a message digest with a private key using ECDSA on the secp256k1 curve.
//
// The nonce k is derived deterministically from (private key, digest) per RFC6979,
// so the same key and digest always produce the same signature. OpenSSL computes
// S from the precomputed k^-1 and R.x through ECDSA_do_sign_ex.
//
// The signature process:
// 1. Derive candidate k from the HMAC-DRBG; skip candidates outside [1, n-1]
// 2. Compute R = k*G and r = R.x mod n; skip if r is zero
// 3. Let OpenSSL compute s = k^-1 (z + r*d) mod n; skip if s is zero
// 4. Normalize S into the lower half of the curve order (BIP62)
// 5. Encode (r, s) in DER
std::vector<uint8_t> EcdsaSigner::sign(std::span<const uint8_t> privkey, std::span<const uint8_t> digest) {
    check_inputs(privkey, digest);

    auto eckey = new_secp256k1_key();
    auto priv = bignum_from_bytes(privkey);
    BN_set_flags(priv.get(), BN_FLG_CONSTTIME);
    if (!EC_KEY_set_private_key(eckey.get(), priv.get())) {
        throw SignerError(SignerError::ErrorType::InvalidPrivateKey, "Private key rejected by OpenSSL");
    }

    const EC_GROUP* group = EC_KEY_get0_group(eckey.get());
    const BIGNUM* order = EC_GROUP_get0_order(group);
    BnCtxPtr ctx(BN_CTX_new(), BN_CTX_free);
    if (!ctx) {
        crypto_failure("BN_CTX_new failed");
    }

    auto reduced = reduce_digest(digest, order, ctx.get());
    Rfc6979Nonce nonce(privkey, reduced);

    for (int attempt = 0; attempt < MAX_NONCE_ATTEMPTS; ++attempt) {
        auto candidate = nonce.next();
        auto k = bignum_from_bytes(candidate);
        OPENSSL_cleanse(candidate.data(), candidate.size());
        if (BN_is_zero(k.get()) || BN_cmp(k.get(), order) >= 0) {
            continue;
        }
        BN_set_flags(k.get(), BN_FLG_CONSTTIME);

        // R = k*G, r = R.x mod n
        PointPtr point(EC_POINT_new(group), EC_POINT_free);
        auto x = new_bignum();
        auto r = new_bignum();
        if (!point ||
            !EC_POINT_mul(group, point.get(), k.get(), nullptr, nullptr, ctx.get()) ||
            !EC_POINT_get_affine_coordinates(group, point.get(), x.get(), nullptr, ctx.get()) ||
            !BN_nnmod(r.get(), x.get(), order, ctx.get())) {
            crypto_failure("Nonce point computation failed");
        }
        if (BN_is_zero(r.get())) {
            continue;
        }

        BignumPtr k_inv(BN_mod_inverse(nullptr, k.get(), order, ctx.get()), BN_clear_free);
        if (!k_inv) {
            crypto_failure("BN_mod_inverse failed");
        }

        // Returns null when s == 0 for this nonce; the next candidate is tried
        SigPtr sig(ECDSA_do_sign_ex(digest.data(), static_cast<int>(digest.size()),
                                    k_inv.get(), r.get(), eckey.get()), ECDSA_SIG_free);
        if (!sig) {
            continue;
        }

        normalize_low_s(sig.get(), order);

        // DER (Distinguished Encoding Rules) is the encoding bitcoin expects for ECDSA signatures
        unsigned char* der = nullptr;
        int der_len = i2d_ECDSA_SIG(sig.get(), &der);
        if (der_len <= 0) {
            crypto_failure("DER encoding failed");
        }
        std::vector<uint8_t> signature(der, der + der_len);
        OPENSSL_free(der);
        return signature;
    }

    crypto_failure("No valid nonce found");
}

bool EcdsaSigner::verify(std::span<const uint8_t> pubkey, std::span<const uint8_t> digest,
                         std::span<const uint8_t> der_signature) {
    if (digest.size() != DIGEST_SIZE) {
        return false;
    }

    auto eckey = new_secp256k1_key();
    const EC_GROUP* group = EC_KEY_get0_group(eckey.get());
    PointPtr point(EC_POINT_new(group), EC_POINT_free);
    if (!point) {
        crypto_failure("EC_POINT_new failed");
    }
    if (!EC_POINT_oct2point(group, point.get(), pubkey.data(), pubkey.size(), nullptr) ||
        !EC_KEY_set_public_key(eckey.get(), point.get())) {
        return false;
    }

    const unsigned char* cursor = der_signature.data();
    SigPtr sig(d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der_signature.size())), ECDSA_SIG_free);
    if (!sig || cursor != der_signature.data() + der_signature.size()) {
        return false;
    }

    return ECDSA_do_verify(digest.data(), static_cast<int>(digest.size()), sig.get(), eckey.get()) == 1;
}

bool EcdsaSigner::has_low_s(std::span<const uint8_t> der_signature) {
    const unsigned char* cursor = der_signature.data();
    SigPtr sig(d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der_signature.size())), ECDSA_SIG_free);
    if (!sig) {
        return false;
    }

    auto eckey = new_secp256k1_key();
    const BIGNUM* order = EC_GROUP_get0_order(EC_KEY_get0_group(eckey.get()));
    auto half_order = new_bignum();
    if (!BN_rshift1(half_order.get(), order)) {
        crypto_failure("BN_rshift1 failed");
    }

    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), nullptr, &s);
    return BN_cmp(s, half_order.get()) <= 0;
}

} // namespace signer
