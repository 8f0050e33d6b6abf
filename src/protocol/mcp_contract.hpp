#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace appbridge::protocol {

    // Who is on the other end of the session
    struct ClientIdentity {
        std::string name;
        std::optional<std::string> version;
    };

    struct InitializeParams {
        ClientIdentity client;
        nlohmann::json experimental_capabilities;  // Accepted, not interpreted
        std::optional<std::string> protocol_version;
    };

    // How a tool is advertised to clients
    struct ToolDescriptor {
        std::string name;
        std::string description;
        std::optional<nlohmann::json> input_schema;
    };

    struct ServerInfo {
        std::string name;
        std::optional<std::string> version;
        std::optional<std::string> description;
    };

    struct ServerCapabilities {
        std::vector<ToolDescriptor> tools;
        std::vector<nlohmann::json> resources;
        std::optional<nlohmann::json> logging;
        std::optional<nlohmann::json> experimental;
    };

    struct InitializeResult {
        std::string protocol_version;
        ServerCapabilities capabilities;
        ServerInfo server_info;
    };

    // How a client asks the server to run a tool. `arguments` is kept as raw
    // JSON: its shape is the tool's business.
    struct ToolCallParams {
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    core::errors::Result<InitializeParams> parse_initialize_params(const nlohmann::json& params);
    core::errors::Result<ToolCallParams> parse_tool_call_params(const nlohmann::json& params);

    nlohmann::json to_json(const ToolDescriptor& descriptor);
    nlohmann::json to_json(const std::vector<ToolDescriptor>& descriptors);
    nlohmann::json to_json(const InitializeResult& result);

    // {"tools": [...]}; the pagination cursor is never set.
    nlohmann::json make_tool_list_result(const std::vector<ToolDescriptor>& descriptors);

    // {"content": [{"type": "text", "text": ...}]}
    nlohmann::json make_tool_call_result(const std::string& text);

} // namespace appbridge::protocol
