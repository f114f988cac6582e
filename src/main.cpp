// btc-signer MCP server
//
// Entry point of the bitcoin signing tool server. The process speaks the
// Model Context Protocol over stdio: JSON-RPC requests arrive one per line on
// stdin and responses are written one per line to stdout.
//
// Tools:
// - generate_address: WIF private key -> P2WPKH bech32 address
// - sign_transaction: adds a partial signature to a PSBT without finalizing it
//
// Diagnostics go to stderr so they never mix with protocol frames.

#include "config.hpp"
#include "mcp_server.hpp"
#include <iostream>
#include <utility>

int main() {
    try {
        auto config = signer::ServerConfig::from_environment(std::cerr);
        signer::McpServer server(std::move(config), std::cin, std::cout, std::cerr);

        std::cerr << "btc-signer MCP Server running on stdio" << std::endl;
        server.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error in main(): " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
