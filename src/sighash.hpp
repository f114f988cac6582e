#pragma once

#include <array>
#include <cstdint>
#include <span>
#include "transaction.hpp"

namespace signer {

class SignatureHash {
public:
    // BIP143 segwit v0 signature hash of tx input `input_index`.
    // script_code is the bare script; amount is the value of the spent output.
    static std::array<uint8_t, 32> bip143(const Transaction& tx,
                                          size_t input_index,
                                          std::span<const uint8_t> script_code,
                                          uint64_t amount,
                                          uint32_t sighash_type);

    // ALL, NONE or SINGLE, optionally with ANYONECANPAY
    static bool is_supported_type(uint32_t sighash_type);

private:
    SignatureHash() = delete;
};

} // namespace signer
