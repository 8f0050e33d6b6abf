#include "server/dispatcher.hpp"

#include <utility>
#include "core/config/server_config.hpp"
#include "core/logging/logger.hpp"

namespace appbridge::server {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::MethodOutcome;
using protocol::RequestEnvelope;
using protocol::ResponseEnvelope;
using protocol::ResponseError;
namespace error_codes = protocol::error_codes;

namespace {

ResponseError make_error(const int code, std::string message,
                         std::optional<json> data = std::nullopt) {
    ResponseError error;
    error.code = code;
    error.message = std::move(message);
    error.data = std::move(data);
    return error;
}

}  // namespace

DispatcherOptions default_dispatcher_options() {
    DispatcherOptions options;
    options.default_protocol_version = core::config::kDefaultProtocolVersion;
    options.server_info.name = core::config::kProjectName;
    options.server_info.version = core::config::kProjectVersion;
    options.server_info.description =
        "Runs AppleScript against named applications over JSON-RPC";
    return options;
}

Dispatcher::Dispatcher(transport::Transport& transport, const tools::ToolRegistry& registry,
                       const tools::ToolInvoker& invoker, DispatcherOptions options)
    : transport_(transport),
      registry_(registry),
      invoker_(invoker),
      options_(std::move(options)) {}

core::errors::Result<std::size_t> Dispatcher::run(session::Session& session) {
    LOG_INFO("Dispatcher: serving session " + session.id() + " with " +
             std::to_string(registry_.size()) + " tools");

    std::size_t processed = 0;
    while (!(options_.stop_token && options_.stop_token->load())) {
        auto frame = transport_.read();
        if (core::errors::is_error(frame)) {
            const auto& err = core::errors::get_error(frame);
            if (core::errors::is_recoverable(err)) {
                LOG_WARN("Dispatcher: dropping malformed frame [" + err.code + "]: " +
                         err.message);
                continue;
            }
            LOG_ERROR("Dispatcher: transport failure [" + err.code + "]: " + err.message);
            return err;
        }

        const auto& payload = core::errors::get_value(frame);
        if (!payload.has_value()) {
            LOG_INFO("Dispatcher: transport closed; shutting down");
            return processed;
        }
        ++processed;

        auto response = handle_payload(payload.value(), session);
        if (core::errors::is_error(response)) {
            const auto& err = core::errors::get_error(response);
            LOG_ERROR("Dispatcher: fatal error [" + err.code + "]: " + err.message);
            return err;
        }

        const auto& envelope = core::errors::get_value(response);
        if (!envelope.has_value()) {
            continue;
        }
        auto written = write_response(envelope.value());
        if (core::errors::is_error(written)) {
            const auto& err = core::errors::get_error(written);
            LOG_ERROR("Dispatcher: failed to write response [" + err.code + "]: " +
                      err.message);
            return err;
        }
    }

    LOG_INFO("Dispatcher: stop requested; shutting down");
    return processed;
}

core::errors::Result<std::optional<ResponseEnvelope>> Dispatcher::handle_payload(
    const std::string& payload, session::Session& session) {
    LOG_DEBUG("Dispatcher: received frame " + payload);
    auto decoded = protocol::decode_request(payload);
    if (core::errors::is_error(decoded)) {
        const auto& err = core::errors::get_error(decoded);
        LOG_WARN("Dispatcher: failed to decode request [" + err.code + "]: " + err.message);
        return std::optional<ResponseEnvelope>{};
    }
    return handle(core::errors::get_value(decoded), session);
}

core::errors::Result<std::optional<ResponseEnvelope>> Dispatcher::handle(
    const RequestEnvelope& request, session::Session& session) {
    if (request.is_notification()) {
        handle_notification(request);
        return std::optional<ResponseEnvelope>{};
    }

    auto routed = route(request, session);
    if (core::errors::is_error(routed)) {
        return core::errors::get_error(routed);
    }

    const auto& outcome = core::errors::get_value(routed);
    if (std::holds_alternative<ResponseError>(outcome)) {
        const auto& error = std::get<ResponseError>(outcome);
        LOG_DEBUG("Dispatcher: " + request.method + " failed with code " +
                  std::to_string(error.code));
        return std::optional<ResponseEnvelope>{
            ResponseEnvelope::failure(request.id.value(), error)};
    }
    return std::optional<ResponseEnvelope>{
        ResponseEnvelope::success(request.id.value(), std::get<json>(outcome))};
}

core::errors::Result<MethodOutcome> Dispatcher::route(const RequestEnvelope& request,
                                                      session::Session& session) {
    const std::string& method = request.method;
    if (method == "initialize") {
        return handle_initialize(request.params, session);
    }
    if (method == "ping") {
        return handle_ping(request.params);
    }
    if (method == "tools/list") {
        return handle_tools_list(request.params);
    }
    if (method == "tools/call") {
        return handle_tools_call(request.params);
    }
    return MethodOutcome{make_error(error_codes::kMethodNotFound,
                                    "method '" + method + "' not implemented")};
}

MethodOutcome Dispatcher::handle_initialize(const json& params, session::Session& session) {
    if (session.is_initialized()) {
        return make_error(error_codes::kInvalidRequest, "initialize already called");
    }

    auto parsed = protocol::parse_initialize_params(params);
    if (core::errors::is_error(parsed)) {
        return make_error(error_codes::kInvalidParams,
                          core::errors::get_error(parsed).message);
    }
    const auto& init = core::errors::get_value(parsed);
    LOG_INFO("Dispatcher: initializing session for client " + init.client.name +
             (init.client.version ? " " + init.client.version.value() : std::string()));

    auto marked = session.mark_initialized();
    if (core::errors::is_error(marked)) {
        return make_error(error_codes::kInvalidRequest, "initialize already called");
    }

    protocol::InitializeResult result;
    result.protocol_version =
        init.protocol_version.value_or(options_.default_protocol_version);
    result.capabilities.tools = registry_.descriptors();
    result.server_info = options_.server_info;
    return protocol::to_json(result);
}

MethodOutcome Dispatcher::handle_ping(const json& params) const {
    std::string message = "pong";
    if (params.is_object()) {
        auto it = params.find("message");
        if (it != params.end() && it->is_string()) {
            message = it->get<std::string>();
        }
    }
    return json{{"message", message}};
}

MethodOutcome Dispatcher::handle_tools_list(const json& params) const {
    if (params.is_object() && params.contains("cursor")) {
        LOG_DEBUG("Dispatcher: tools/list cursor ignored; the catalog is a single page");
    }
    return protocol::make_tool_list_result(registry_.descriptors());
}

core::errors::Result<MethodOutcome> Dispatcher::handle_tools_call(const json& params) {
    auto parsed = protocol::parse_tool_call_params(params);
    if (core::errors::is_error(parsed)) {
        return MethodOutcome{make_error(error_codes::kInvalidParams,
                                        core::errors::get_error(parsed).message)};
    }
    const auto& call = core::errors::get_value(parsed);

    const tools::Tool* tool = registry_.find(call.name);
    if (tool == nullptr) {
        return MethodOutcome{make_error(error_codes::kInvalidParams,
                                        "unknown tool '" + call.name + "'",
                                        json{{"name", call.name}})};
    }

    const json* script = nullptr;
    if (call.arguments.is_object()) {
        auto it = call.arguments.find("script");
        if (it != call.arguments.end() && it->is_string()) {
            script = &(*it);
        }
    }
    if (script == nullptr) {
        return MethodOutcome{make_error(
            error_codes::kInvalidParams,
            "tool '" + call.name + "' requires a 'script' string argument",
            json{{"argument", "script"}})};
    }

    auto invoked = invoker_.invoke(*tool, script->get<std::string>());
    if (core::errors::is_error(invoked)) {
        const auto& err = core::errors::get_error(invoked);
        if (err.category == ErrorCategory::Policy) {
            LOG_WARN("Dispatcher: rejected script for " + call.name + " [" + err.code +
                     "]: " + err.message);
            return MethodOutcome{make_error(error_codes::kInvalidParams,
                                            "tool '" + call.name +
                                                "' rejected the script: " + err.message,
                                            json{{"reason", err.code}})};
        }
        return err;
    }

    const auto& outcome = core::errors::get_value(invoked);
    if (outcome.success) {
        return MethodOutcome{protocol::make_tool_call_result(outcome.stdout_text)};
    }

    json data;
    data["stderr"] = outcome.stderr_text;
    data["status"] = outcome.exit_code;
    std::string message = "tool '" + call.name + "' execution failed";
    if (outcome.timed_out) {
        data["timed_out"] = true;
        message = "tool '" + call.name + "' timed out";
    } else if (outcome.cancelled) {
        data["cancelled"] = true;
        message = "tool '" + call.name + "' was cancelled";
    }
    LOG_WARN("Dispatcher: " + message + " (status " + std::to_string(outcome.exit_code) + ")");
    return MethodOutcome{make_error(error_codes::kToolExecutionFailed, message, data)};
}

void Dispatcher::handle_notification(const RequestEnvelope& request) const {
    if (request.method == "shutdown") {
        LOG_INFO("Dispatcher: client requested shutdown");
        return;
    }
    LOG_DEBUG("Dispatcher: ignoring unsupported notification " + request.method);
}

core::errors::Result<std::size_t> Dispatcher::write_response(
    const ResponseEnvelope& response) {
    auto encoded = protocol::encode_response(response);
    if (core::errors::is_error(encoded)) {
        return core::errors::get_error(encoded);
    }
    return transport_.write(core::errors::get_value(encoded));
}

}  // namespace appbridge::server
