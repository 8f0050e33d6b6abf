#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/envelope.hpp"
#include "protocol/mcp_contract.hpp"
#include "session/session.hpp"
#include "tools/tool_invoker.hpp"
#include "tools/tool_registry.hpp"
#include "transport/transport.hpp"

namespace appbridge::server {

struct DispatcherOptions {
    std::string default_protocol_version;
    protocol::ServerInfo server_info;
    // Checked between frames; once set the loop stops reading.
    std::shared_ptr<std::atomic_bool> stop_token;
};

DispatcherOptions default_dispatcher_options();

// Reads one frame at a time, routes it and writes the answer before the next
// read. Handler failures that the client can act on become error responses;
// the errors this class returns are fatal for the session.
class Dispatcher {
public:
    Dispatcher(transport::Transport& transport, const tools::ToolRegistry& registry,
               const tools::ToolInvoker& invoker,
               DispatcherOptions options = default_dispatcher_options());

    // Runs until the peer closes the stream (returns the number of frames
    // processed) or a host/transport failure occurs.
    core::errors::Result<std::size_t> run(session::Session& session);

    // Decodes and handles one payload. Undecodable payloads are logged and
    // yield no response.
    core::errors::Result<std::optional<protocol::ResponseEnvelope>> handle_payload(
        const std::string& payload, session::Session& session);

    // Notifications yield no response.
    core::errors::Result<std::optional<protocol::ResponseEnvelope>> handle(
        const protocol::RequestEnvelope& request, session::Session& session);

private:
    core::errors::Result<protocol::MethodOutcome> route(
        const protocol::RequestEnvelope& request, session::Session& session);

    protocol::MethodOutcome handle_initialize(const nlohmann::json& params,
                                              session::Session& session);
    protocol::MethodOutcome handle_ping(const nlohmann::json& params) const;
    protocol::MethodOutcome handle_tools_list(const nlohmann::json& params) const;
    core::errors::Result<protocol::MethodOutcome> handle_tools_call(
        const nlohmann::json& params);
    void handle_notification(const protocol::RequestEnvelope& request) const;

    core::errors::Result<std::size_t> write_response(
        const protocol::ResponseEnvelope& response);

    transport::Transport& transport_;
    const tools::ToolRegistry& registry_;
    const tools::ToolInvoker& invoker_;
    DispatcherOptions options_;
};

}  // namespace appbridge::server
