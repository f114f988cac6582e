#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "network.hpp"

namespace signer {

// Immutable process-wide settings of the MCP server
struct ServerConfig {
    std::string server_name = "btc-signer";
    std::string server_version = "1.0.0";

    // Newest MCP revision first; an initialize request naming any of these is echoed back
    std::vector<std::string> protocol_versions = {"2025-06-18", "2025-03-26", "2024-11-05"};

    // Network used when a tool call omits the testnet flag
    Network default_network = Network::Mainnet;

    const std::string& latest_protocol_version() const { return protocol_versions.front(); }
    bool supports_protocol_version(const std::string& version) const;

    // Reads BTC_SIGNER_NETWORK; unrecognized values are reported on log and ignored
    static ServerConfig from_environment(std::ostream& log);
};

} // namespace signer
