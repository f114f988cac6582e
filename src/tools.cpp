#include "tools.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "psbt.hpp"
#include "psbt_signer.hpp"
#include "segwit.hpp"
#include "wif.hpp"
#include <utility>

using json = nlohmann::json;

namespace signer {

namespace {

constexpr auto INTERNAL_ERROR_CODE = "InternalError";

ToolResult success(const std::string& text, json structured) {
    return ToolResult{
        .is_error = false,
        .text = text,
        .structured = std::move(structured),
        .error_type = ""
    };
}

ToolResult failure(const std::string& prefix, const std::string& message, const std::string& code) {
    return ToolResult{
        .is_error = true,
        .text = prefix + message,
        .structured = json{{"error", message}, {"code", code}},
        .error_type = code
    };
}

// Runs a tool body and converts every exception into a failure result
template <typename Body>
ToolResult run_tool(const std::string& error_prefix, Body&& body) {
    try {
        return body();
    } catch (const SignerError& e) {
        return failure(error_prefix, e.what(), error_type_name(e.type()));
    } catch (const std::exception& e) {
        return failure(error_prefix, e.what(), INTERNAL_ERROR_CODE);
    }
}

} // namespace

std::string SignerTools::generate_address(const std::string& wif, Network network) {
    auto key = Wif::decode(wif, network);
    return Segwit::encode_p2wpkh_address(key.public_key(), network);
}

// Sign a PSBT for one key without finalizing it
//
// 1. Decode the hex container (InvalidEncoding)
// 2. Import the key for the requested network
// 3. Parse the container (MalformedContainer)
// 4. Add partial signatures for every input spending the key's P2WPKH output
// 5. Re-serialize; bytes outside the signed inputs are unchanged
std::string SignerTools::sign_psbt(const std::string& psbt_hex, const std::string& wif, Network network) {
    auto psbt_bytes = HexUtils::decode(psbt_hex);
    auto key = Wif::decode(wif, network);

    auto psbt = Psbt::parse(psbt_bytes);
    PsbtSigner signer(key);
    signer.sign(psbt);
    return HexUtils::encode(psbt.serialize());
}

ToolResult SignerTools::run_generate_address(const std::string& wif, bool testnet) {
    return run_tool("Error generating address: ", [&]() {
        auto address = generate_address(wif, network_from_testnet_flag(testnet));
        return success("Generated Address: " + address, json{{"address", address}});
    });
}

ToolResult SignerTools::run_sign_transaction(const std::string& psbt_hex, const std::string& wif, bool testnet) {
    return run_tool("Error signing transaction: ", [&]() {
        auto signed_hex = sign_psbt(psbt_hex, wif, network_from_testnet_flag(testnet));
        return success("Signed PSBT: " + signed_hex, json{{"psbtHex", signed_hex}});
    });
}

} // namespace signer
