#pragma once

#include <string>
#include "network.hpp"
#include "private_key.hpp"

namespace signer {

// Wallet Import Format: Base58Check(version || key32 [|| 0x01])
class Wif {
public:
    // Decodes a WIF string for the given network.
    // Throws SignerError with InvalidEncoding, InvalidChecksum, NetworkMismatch
    // or InvalidPrivateKey.
    static PrivateKey decode(const std::string& wif, Network network);

    static std::string encode(const PrivateKey& key, Network network);

private:
    Wif() = delete;
};

} // namespace signer
