#pragma once

#include <atomic>
#include <memory>
#include "core/config/server_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "transport/transport.hpp"

namespace appbridge::transport {

// Picks the transport named by the configuration. Called once at startup.
core::errors::Result<std::unique_ptr<Transport>> create_transport(
    const core::config::ServerConfig& config,
    std::shared_ptr<std::atomic_bool> stop_token = nullptr);

}  // namespace appbridge::transport
