#pragma once
#include <string>
#include "core/config/server_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace appbridge::app::cli {
    appbridge::core::errors::Result<appbridge::core::config::ServerConfig> parse_server_args(int argc, char* argv[]);
    appbridge::core::errors::Result<appbridge::core::config::ClientConfig> parse_client_args(int argc, char* argv[]);

    std::string server_usage();
    std::string client_usage();
}
