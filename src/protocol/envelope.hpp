#pragma once

#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace appbridge::protocol {

inline constexpr const char* kJsonRpcVersion = "2.0";

namespace error_codes {
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kToolExecutionFailed = -32010;
}  // namespace error_codes

// A request or, when `id` is empty, a notification.
struct RequestEnvelope {
    std::string jsonrpc = kJsonRpcVersion;
    std::optional<nlohmann::json> id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    bool is_notification() const { return !id.has_value(); }
};

struct ResponseError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;
};

// Carries exactly one of result or error; the factories are the only way
// to build one.
class ResponseEnvelope {
public:
    static ResponseEnvelope success(nlohmann::json id, nlohmann::json result);
    static ResponseEnvelope failure(nlohmann::json id, ResponseError error);

    const std::string& jsonrpc() const { return jsonrpc_; }
    const nlohmann::json& id() const { return id_; }
    bool is_error() const { return error_.has_value(); }
    const nlohmann::json& result() const { return *result_; }
    const ResponseError& error() const { return *error_; }

private:
    ResponseEnvelope(nlohmann::json id, std::optional<nlohmann::json> result,
                     std::optional<ResponseError> error);

    std::string jsonrpc_ = kJsonRpcVersion;
    nlohmann::json id_;
    std::optional<nlohmann::json> result_;
    std::optional<ResponseError> error_;
};

// What a method handler produces: a result value or a protocol error.
using MethodOutcome = std::variant<nlohmann::json, ResponseError>;

core::errors::Result<RequestEnvelope> decode_request(const std::string& text);
core::errors::Result<std::string> encode_request(const RequestEnvelope& request);

core::errors::Result<ResponseEnvelope> decode_response(const std::string& text);
core::errors::Result<std::string> encode_response(const ResponseEnvelope& response);

nlohmann::json to_json(const ResponseEnvelope& response);

}  // namespace appbridge::protocol
