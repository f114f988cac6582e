#include "private_key.hpp"
#include "error.hpp"
#include "key_util.hpp"

namespace signer {

PrivateKey::PrivateKey(std::span<const uint8_t> bytes, bool compressed)
    : secret_(bytes), compressed_(compressed) {
    if (!KeyUtil::is_valid_private_key(secret_.bytes())) {
        throw SignerError(SignerError::ErrorType::InvalidPrivateKey,
            "Private key must be 32 bytes in range [1, n-1]");
    }
}

std::vector<uint8_t> PrivateKey::public_key() const {
    return KeyUtil::derive_public_key(secret_.bytes());
}

} // namespace signer
