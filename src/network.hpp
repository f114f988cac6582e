#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace signer {

enum class Network {
    Mainnet,
    Testnet
};

// Per-network encoding constants
struct NetworkParams {
    Network network;
    const char* name;
    uint8_t wif_prefix;     // Version byte of a WIF private key
    const char* bech32_hrp; // Human-readable part of a segwit address
};

const NetworkParams& network_params(Network network);

// The tool surface selects the network with a boolean testnet flag
Network network_from_testnet_flag(bool testnet);

// Parses "mainnet" or "testnet" (case-insensitive)
std::optional<Network> parse_network(std::string_view name);

} // namespace signer
