#include "config.hpp"
#include <algorithm>
#include <cstdlib>

namespace signer {

constexpr auto NETWORK_ENV_VAR = "BTC_SIGNER_NETWORK";

bool ServerConfig::supports_protocol_version(const std::string& version) const {
    return std::find(protocol_versions.begin(), protocol_versions.end(), version) != protocol_versions.end();
}

ServerConfig ServerConfig::from_environment(std::ostream& log) {
    ServerConfig config;

    const char* network = std::getenv(NETWORK_ENV_VAR);
    if (network != nullptr && *network != '\0') {
        if (auto parsed = parse_network(network)) {
            config.default_network = *parsed;
        } else {
            log << "Warning: ignoring " << NETWORK_ENV_VAR << "=" << network
                << " (expected mainnet or testnet)" << std::endl;
        }
    }
    return config;
}

} // namespace signer
