#include "protocol/envelope.hpp"

#include <utility>

namespace appbridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

core::errors::Result<json> parse_object(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        return BridgeError{ErrorCategory::Protocol,
                           std::string("Payload is not valid JSON: ") + e.what(),
                           "invalid_json"};
    }
    if (!root.is_object()) {
        return BridgeError{ErrorCategory::Protocol, "Payload is not a JSON object.",
                           "invalid_request"};
    }
    return root;
}

core::errors::Result<std::string> dump(const json& value) {
    try {
        return value.dump();
    } catch (const json::type_error& e) {
        return BridgeError{ErrorCategory::Internal,
                           std::string("Failed to serialize JSON payload: ") + e.what(),
                           "serialization_failed"};
    }
}

json error_to_json(const ResponseError& error) {
    json payload;
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (error.data.has_value()) {
        payload["data"] = error.data.value();
    }
    return payload;
}

}  // namespace

ResponseEnvelope::ResponseEnvelope(json id, std::optional<json> result,
                                   std::optional<ResponseError> error)
    : id_(std::move(id)), result_(std::move(result)), error_(std::move(error)) {}

ResponseEnvelope ResponseEnvelope::success(json id, json result) {
    return ResponseEnvelope(std::move(id), std::move(result), std::nullopt);
}

ResponseEnvelope ResponseEnvelope::failure(json id, ResponseError error) {
    return ResponseEnvelope(std::move(id), std::nullopt, std::move(error));
}

core::errors::Result<RequestEnvelope> decode_request(const std::string& text) {
    auto parsed = parse_object(text);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const json& root = core::errors::get_value(parsed);

    RequestEnvelope request;
    if (auto it = root.find("jsonrpc"); it != root.end()) {
        if (!it->is_string()) {
            return BridgeError{ErrorCategory::Protocol, "'jsonrpc' must be a string.",
                               "invalid_request"};
        }
        request.jsonrpc = it->get<std::string>();
    }

    auto method = root.find("method");
    if (method == root.end() || !method->is_string()) {
        return BridgeError{ErrorCategory::Protocol,
                           "Request is missing a string 'method'.", "invalid_request"};
    }
    request.method = method->get<std::string>();

    // A null id is treated like an absent one.
    if (auto id = root.find("id"); id != root.end() && !id->is_null()) {
        request.id = *id;
    }

    if (auto params = root.find("params"); params != root.end() && !params->is_null()) {
        request.params = *params;
    }
    return request;
}

core::errors::Result<std::string> encode_request(const RequestEnvelope& request) {
    json payload;
    payload["jsonrpc"] = request.jsonrpc;
    if (request.id.has_value()) {
        payload["id"] = request.id.value();
    }
    payload["method"] = request.method;
    payload["params"] = request.params;
    return dump(payload);
}

json to_json(const ResponseEnvelope& response) {
    json payload;
    payload["jsonrpc"] = response.jsonrpc();
    payload["id"] = response.id();
    if (response.is_error()) {
        payload["error"] = error_to_json(response.error());
    } else {
        payload["result"] = response.result();
    }
    return payload;
}

core::errors::Result<std::string> encode_response(const ResponseEnvelope& response) {
    return dump(to_json(response));
}

core::errors::Result<ResponseEnvelope> decode_response(const std::string& text) {
    auto parsed = parse_object(text);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const json& root = core::errors::get_value(parsed);

    const json id = root.contains("id") ? root.at("id") : json();
    const bool has_result = root.contains("result");
    const bool has_error = root.contains("error");
    if (has_result == has_error) {
        return BridgeError{ErrorCategory::Protocol,
                           "Response must carry exactly one of 'result' or 'error'.",
                           "invalid_response"};
    }
    if (has_result) {
        return ResponseEnvelope::success(id, root.at("result"));
    }

    const json& error = root.at("error");
    if (!error.is_object() || !error.contains("code") || !error.at("code").is_number_integer() ||
        !error.contains("message") || !error.at("message").is_string()) {
        return BridgeError{ErrorCategory::Protocol,
                           "Response error must have an integer 'code' and a string 'message'.",
                           "invalid_response"};
    }
    ResponseError decoded;
    decoded.code = error.at("code").get<int>();
    decoded.message = error.at("message").get<std::string>();
    if (error.contains("data")) {
        decoded.data = error.at("data");
    }
    return ResponseEnvelope::failure(id, std::move(decoded));
}

}  // namespace appbridge::protocol
