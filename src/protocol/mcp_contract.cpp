#include "protocol/mcp_contract.hpp"

namespace appbridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

BridgeError invalid_params(const std::string& message) {
    return BridgeError{ErrorCategory::Protocol, message, "invalid_params"};
}

json server_info_to_json(const ServerInfo& info) {
    json payload;
    payload["name"] = info.name;
    payload["version"] = info.version.has_value() ? json(info.version.value()) : json();
    if (info.description.has_value()) {
        payload["description"] = info.description.value();
    }
    return payload;
}

json capabilities_to_json(const ServerCapabilities& capabilities) {
    json payload;
    payload["tools"] = to_json(capabilities.tools);
    payload["resources"] = json::array();
    for (const auto& resource : capabilities.resources) {
        payload["resources"].push_back(resource);
    }
    if (capabilities.logging.has_value()) {
        payload["logging"] = capabilities.logging.value();
    }
    if (capabilities.experimental.has_value()) {
        payload["experimental"] = capabilities.experimental.value();
    }
    return payload;
}

}  // namespace

core::errors::Result<InitializeParams> parse_initialize_params(const json& params) {
    if (!params.is_object()) {
        return invalid_params("initialize params must be an object.");
    }

    auto client = params.find("client");
    if (client == params.end() || !client->is_object()) {
        return invalid_params("initialize params require a 'client' object.");
    }
    auto name = client->find("name");
    if (name == client->end() || !name->is_string()) {
        return invalid_params("initialize 'client.name' must be a string.");
    }

    InitializeParams result;
    result.client.name = name->get<std::string>();
    if (auto version = client->find("version"); version != client->end() && !version->is_null()) {
        if (!version->is_string()) {
            return invalid_params("initialize 'client.version' must be a string.");
        }
        result.client.version = version->get<std::string>();
    }

    if (auto capabilities = params.find("capabilities");
        capabilities != params.end() && !capabilities->is_null()) {
        if (!capabilities->is_object()) {
            return invalid_params("initialize 'capabilities' must be an object.");
        }
        result.experimental_capabilities = capabilities->value("experimental", json());
    }

    if (auto version = params.find("protocol_version");
        version != params.end() && !version->is_null()) {
        if (!version->is_string()) {
            return invalid_params("initialize 'protocol_version' must be a string.");
        }
        result.protocol_version = version->get<std::string>();
    }
    return result;
}

core::errors::Result<ToolCallParams> parse_tool_call_params(const json& params) {
    if (!params.is_object()) {
        return invalid_params("tools/call params must be an object.");
    }
    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return invalid_params("tools/call params require a string 'name'.");
    }

    ToolCallParams result;
    result.name = name->get<std::string>();
    if (auto arguments = params.find("arguments");
        arguments != params.end() && !arguments->is_null()) {
        result.arguments = *arguments;
    }
    return result;
}

json to_json(const ToolDescriptor& descriptor) {
    json payload;
    payload["name"] = descriptor.name;
    payload["description"] = descriptor.description;
    if (descriptor.input_schema.has_value()) {
        payload["input_schema"] = descriptor.input_schema.value();
    }
    return payload;
}

json to_json(const std::vector<ToolDescriptor>& descriptors) {
    json list = json::array();
    for (const auto& descriptor : descriptors) {
        list.push_back(to_json(descriptor));
    }
    return list;
}

json to_json(const InitializeResult& result) {
    json payload;
    payload["protocol_version"] = result.protocol_version;
    payload["capabilities"] = capabilities_to_json(result.capabilities);
    payload["server_info"] = server_info_to_json(result.server_info);
    return payload;
}

json make_tool_list_result(const std::vector<ToolDescriptor>& descriptors) {
    json payload;
    payload["tools"] = to_json(descriptors);
    return payload;
}

json make_tool_call_result(const std::string& text) {
    json content;
    content["type"] = "text";
    content["text"] = text;

    json payload;
    payload["content"] = json::array({content});
    return payload;
}

}  // namespace appbridge::protocol
