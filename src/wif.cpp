#include "wif.hpp"
#include "base58.hpp"
#include "consts.hpp"
#include "error.hpp"
#include <openssl/crypto.h>
#include <cstdio>
#include <span>
#include <vector>

namespace signer {

namespace {

// Wipes a decoded payload when it goes out of scope, including on throw
struct PayloadGuard {
    std::vector<uint8_t>& payload;
    ~PayloadGuard() { OPENSSL_cleanse(payload.data(), payload.size()); }
};

std::string hex_byte(uint8_t value) {
    char buf[5];
    std::snprintf(buf, sizeof(buf), "0x%02x", value);
    return buf;
}

} // namespace

// Decodes a WIF private key.
//
// Layout of the Base58Check payload:
// - [1 byte]  : Version (0x80 mainnet, 0xef testnet)
// - [32 bytes]: Private key scalar, big-endian
// - [1 byte]  : Optional 0x01 compression flag
//
// The checksum is verified first, then the version byte against the requested
// network, then the payload length and finally the scalar range.
PrivateKey Wif::decode(const std::string& wif, Network network) {
    auto payload = Base58::decode_check(wif);
    PayloadGuard guard{payload};

    if (payload.empty()) {
        throw SignerError(SignerError::ErrorType::InvalidEncoding, "Empty WIF payload");
    }

    const auto& params = network_params(network);
    if (payload[0] != params.wif_prefix) {
        throw SignerError(SignerError::ErrorType::NetworkMismatch,
            "WIF version byte " + hex_byte(payload[0]) + " does not match " +
            params.name + " (expected " + hex_byte(params.wif_prefix) + ")");
    }

    bool compressed = false;
    if (payload.size() == 1 + PRIVATE_KEY_SIZE + 1 && payload.back() == WIF_COMPRESSED_FLAG) {
        compressed = true;
    } else if (payload.size() != 1 + PRIVATE_KEY_SIZE) {
        throw SignerError(SignerError::ErrorType::InvalidPrivateKey,
            "Unexpected WIF payload length " + std::to_string(payload.size()));
    }

    return PrivateKey(std::span<const uint8_t>(payload.data() + 1, PRIVATE_KEY_SIZE), compressed);
}

std::string Wif::encode(const PrivateKey& key, Network network) {
    std::vector<uint8_t> payload;
    PayloadGuard guard{payload};
    payload.reserve(1 + PRIVATE_KEY_SIZE + 1);
    payload.push_back(network_params(network).wif_prefix);
    payload.insert(payload.end(), key.bytes().begin(), key.bytes().end());
    if (key.compressed()) {
        payload.push_back(WIF_COMPRESSED_FLAG);
    }
    return Base58::encode_check(payload);
}

} // namespace signer
