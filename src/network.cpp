#include "network.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace signer {

namespace {

constexpr NetworkParams MAINNET_PARAMS{
    .network = Network::Mainnet,
    .name = "mainnet",
    .wif_prefix = 0x80,
    .bech32_hrp = "bc"
};

constexpr NetworkParams TESTNET_PARAMS{
    .network = Network::Testnet,
    .name = "testnet",
    .wif_prefix = 0xef,
    .bech32_hrp = "tb"
};

} // namespace

const NetworkParams& network_params(Network network) {
    return network == Network::Testnet ? TESTNET_PARAMS : MAINNET_PARAMS;
}

Network network_from_testnet_flag(bool testnet) {
    return testnet ? Network::Testnet : Network::Mainnet;
}

std::optional<Network> parse_network(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == MAINNET_PARAMS.name) {
        return Network::Mainnet;
    }
    if (lowered == TESTNET_PARAMS.name) {
        return Network::Testnet;
    }
    return std::nullopt;
}

} // namespace signer
