#pragma once

#include <gtest/gtest.h>
#include "error.hpp"
#include "hex_utils.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace signer_test {

inline std::vector<uint8_t> from_hex(const std::string& hex) {
    return signer::HexUtils::decode(hex);
}

// Runs fn and checks it throws SignerError of the given type
template <typename Fn>
void expect_signer_error(Fn&& fn, signer::SignerError::ErrorType expected) {
    try {
        fn();
    } catch (const signer::SignerError& e) {
        EXPECT_STREQ(signer::error_type_name(e.type()), signer::error_type_name(expected)) << e.what();
        return;
    }
    ADD_FAILURE() << "Expected SignerError " << signer::error_type_name(expected);
}

} // namespace signer_test
