#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "network.hpp"

namespace signer {

// Outcome of one tool call as reported to the MCP client
struct ToolResult {
    bool is_error = false;
    std::string text;            // Human-readable content block
    nlohmann::json structured;   // {address} / {psbtHex} on success, {error, code} on failure
    std::string error_type;      // error_type_name() of the failure, empty on success
};

// The two operations exposed to the calling agent
class SignerTools {
public:
    // WIF -> P2WPKH bech32 address. Throws SignerError.
    static std::string generate_address(const std::string& wif, Network network);

    // Adds this key's partial signatures to a hex PSBT and returns the new hex.
    // The hex is decoded before the WIF. Throws SignerError.
    static std::string sign_psbt(const std::string& psbt_hex, const std::string& wif, Network network);

    // Non-throwing wrappers producing the tool result texts
    static ToolResult run_generate_address(const std::string& wif, bool testnet);
    static ToolResult run_sign_transaction(const std::string& psbt_hex, const std::string& wif, bool testnet);

private:
    SignerTools() = delete;
};

} // namespace signer
