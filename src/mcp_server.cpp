#include "mcp_server.hpp"
#include "tools.hpp"
#include <utility>

using json = nlohmann::json;

namespace signer {

namespace {

constexpr auto JSONRPC_VERSION = "2.0";
constexpr auto TOOL_GENERATE_ADDRESS = "generate_address";
constexpr auto TOOL_SIGN_TRANSACTION = "sign_transaction";

json make_response(const json& id, json result) {
    return json{{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"result", std::move(result)}};
}

json make_error(const json& id, RpcErrorCode code, const std::string& message) {
    return json{
        {"jsonrpc", JSONRPC_VERSION},
        {"id", id},
        {"error", {{"code", static_cast<int>(code)}, {"message", message}}}
    };
}

bool is_valid_id(const json& id) {
    return id.is_string() || id.is_number_integer();
}

std::string require_string(const json& args, const char* name) {
    auto it = args.find(name);
    if (it == args.end()) {
        throw RpcError(RpcErrorCode::InvalidParams, std::string("Missing required argument: ") + name);
    }
    if (!it->is_string()) {
        throw RpcError(RpcErrorCode::InvalidParams, std::string("Argument ") + name + " must be a string");
    }
    return it->get<std::string>();
}

bool optional_bool(const json& args, const char* name, bool fallback) {
    auto it = args.find(name);
    if (it == args.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        throw RpcError(RpcErrorCode::InvalidParams, std::string("Argument ") + name + " must be a boolean");
    }
    return it->get<bool>();
}

json wif_schema() {
    return json{
        {"type", "string"},
        {"description", "Private key in Wallet Import Format"}
    };
}

json testnet_schema() {
    return json{
        {"type", "boolean"},
        {"description", "Use testnet instead of mainnet"},
        {"default", false}
    };
}

json tool_result_to_json(const ToolResult& result) {
    return json{
        {"content", json::array({json{{"type", "text"}, {"text", result.text}}})},
        {"structuredContent", result.structured},
        {"isError", result.is_error}
    };
}

} // namespace

McpServer::McpServer(ServerConfig config, std::istream& in, std::ostream& out, std::ostream& log)
    : config_(std::move(config))
    , in_(in)
    , out_(out)
    , log_(log)
{}

void McpServer::run() {
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        if (auto response = handle_message(line)) {
            write_message(*response);
        }
    }
}

// Handle one JSON-RPC message
//
// - Requests (method + id) always produce a response, either a result or an error
// - Notifications (method, no id) never produce a response
// - Responses from the client (result or error, no method) are ignored
std::optional<json> McpServer::handle_message(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        log_ << "Parse error: " << e.what() << std::endl;
        return make_error(nullptr, RpcErrorCode::ParseError, "Parse error");
    }

    if (!message.is_object()) {
        return make_error(nullptr, RpcErrorCode::InvalidRequest, "Invalid Request: expected a JSON object");
    }

    auto id_it = message.find("id");
    bool has_id = id_it != message.end();
    json id = has_id && is_valid_id(*id_it) ? *id_it : json(nullptr);

    if (!message.contains("method") && (message.contains("result") || message.contains("error"))) {
        return std::nullopt;
    }
    if (!message.contains("jsonrpc") || message["jsonrpc"] != JSONRPC_VERSION) {
        return make_error(id, RpcErrorCode::InvalidRequest, "Invalid Request: jsonrpc must be \"2.0\"");
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return make_error(id, RpcErrorCode::InvalidRequest, "Invalid Request: method must be a string");
    }
    if (has_id && !is_valid_id(*id_it)) {
        return make_error(nullptr, RpcErrorCode::InvalidRequest, "Invalid Request: id must be a string or integer");
    }

    std::string method = message["method"].get<std::string>();
    if (!has_id) {
        // notifications/initialized, notifications/cancelled and the like need no action
        return std::nullopt;
    }

    json params = message.value("params", json::object());
    try {
        return make_response(id, dispatch(method, params));
    } catch (const RpcError& e) {
        log_ << "Request " << method << " failed: " << e.what() << std::endl;
        return make_error(id, e.code(), e.what());
    } catch (const std::exception& e) {
        log_ << "Internal error in " << method << ": " << e.what() << std::endl;
        return make_error(id, RpcErrorCode::InternalError, "Internal error");
    }
}

json McpServer::dispatch(const std::string& method, const json& params) {
    if (!params.is_object()) {
        throw RpcError(RpcErrorCode::InvalidParams, "params must be an object");
    }
    if (method == "initialize") {
        return handle_initialize(params);
    }
    if (method == "ping") {
        return json::object();
    }
    if (method == "tools/list") {
        return handle_tools_list();
    }
    if (method == "tools/call") {
        return handle_tools_call(params);
    }
    throw RpcError(RpcErrorCode::MethodNotFound, "Method not found: " + method);
}

json McpServer::handle_initialize(const json& params) const {
    std::string version = config_.latest_protocol_version();
    auto requested = params.find("protocolVersion");
    if (requested != params.end() && requested->is_string() &&
        config_.supports_protocol_version(requested->get<std::string>())) {
        version = requested->get<std::string>();
    }

    return json{
        {"protocolVersion", version},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", config_.server_name}, {"version", config_.server_version}}}
    };
}

json McpServer::handle_tools_list() const {
    json generate_address = {
        {"name", TOOL_GENERATE_ADDRESS},
        {"description", "Generate a P2WPKH (native segwit) bitcoin address from a WIF private key"},
        {"inputSchema", {
            {"type", "object"},
            {"properties", {
                {"privateKeyWif", wif_schema()},
                {"testnet", testnet_schema()}
            }},
            {"required", json::array({"privateKeyWif"})}
        }}
    };

    json sign_transaction = {
        {"name", TOOL_SIGN_TRANSACTION},
        {"description", "Add a partial signature to a PSBT for every P2WPKH input of the given key, without finalizing"},
        {"inputSchema", {
            {"type", "object"},
            {"properties", {
                {"psbtHex", {{"type", "string"}, {"description", "Hex-encoded PSBT"}}},
                {"privateKeyWif", wif_schema()},
                {"testnet", testnet_schema()}
            }},
            {"required", json::array({"psbtHex", "privateKeyWif"})}
        }}
    };

    return json{{"tools", json::array({generate_address, sign_transaction})}};
}

json McpServer::handle_tools_call(const json& params) {
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        throw RpcError(RpcErrorCode::InvalidParams, "Tool name must be a string");
    }
    std::string name = name_it->get<std::string>();

    json args = params.value("arguments", json::object());
    if (!args.is_object()) {
        throw RpcError(RpcErrorCode::InvalidParams, "Tool arguments must be an object");
    }

    bool default_testnet = config_.default_network == Network::Testnet;

    ToolResult result;
    bool testnet = false;
    if (name == TOOL_GENERATE_ADDRESS) {
        auto wif = require_string(args, "privateKeyWif");
        testnet = optional_bool(args, "testnet", default_testnet);
        result = SignerTools::run_generate_address(wif, testnet);
    } else if (name == TOOL_SIGN_TRANSACTION) {
        auto psbt_hex = require_string(args, "psbtHex");
        auto wif = require_string(args, "privateKeyWif");
        testnet = optional_bool(args, "testnet", default_testnet);
        result = SignerTools::run_sign_transaction(psbt_hex, wif, testnet);
    } else {
        throw RpcError(RpcErrorCode::InvalidParams, "Unknown tool: " + name);
    }

    log_ << "Tool " << name << " on " << network_params(network_from_testnet_flag(testnet)).name
         << ": " << (result.is_error ? "failed (" + result.error_type + ")" : std::string("ok")) << std::endl;

    return tool_result_to_json(result);
}

void McpServer::write_message(const json& message) {
    out_ << message.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    out_.flush();
}

} // namespace signer
