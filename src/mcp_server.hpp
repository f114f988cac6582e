#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"

namespace signer {

// JSON-RPC 2.0 error codes
enum class RpcErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603
};

// Raised by request handlers; becomes a JSON-RPC error response
class RpcError : public std::runtime_error {
public:
    RpcError(RpcErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {}

    RpcErrorCode code() const { return code_; }

private:
    RpcErrorCode code_;
};

// Model Context Protocol server over newline-delimited JSON-RPC on a stream pair.
// Serves the generate_address and sign_transaction tools one request at a time.
class McpServer {
public:
    McpServer(ServerConfig config, std::istream& in, std::ostream& out, std::ostream& log);

    // Reads messages until end of input
    void run();

    // Handles one framed message; nullopt for notifications and client responses
    std::optional<nlohmann::json> handle_message(const std::string& line);

private:
    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);

    nlohmann::json handle_initialize(const nlohmann::json& params) const;
    nlohmann::json handle_tools_list() const;
    nlohmann::json handle_tools_call(const nlohmann::json& params);

    void write_message(const nlohmann::json& message);

    ServerConfig config_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& log_;
};

} // namespace signer
