#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"

namespace appbridge::core::config {

    inline constexpr const char* kProjectName = "appbridge";
    inline constexpr const char* kProjectVersion = "0.1.0";
    inline constexpr const char* kDefaultProtocolVersion = "2024-10-30";

    enum class TransportKind {
        Stdio,
        UnixSocket  // Accepted by the parser, not implemented yet
    };

    // Validated server settings, produced by app::cli::parse_server_args
    struct ServerConfig {
        TransportKind transport = TransportKind::Stdio;
        std::optional<std::filesystem::path> socket_path;
        std::filesystem::path scripts_dir = "../AppScripts";
        std::string interpreter = "osascript";
        std::vector<std::string> interpreter_args = {"-e"};
        std::uint32_t timeout_ms = 30000;
        std::size_t max_frame_bytes = 16 * 1024 * 1024;
        bool allow_shell_scripts = false;
        logging::LogLevel log_level = logging::LogLevel::INFO;
        bool show_help = false;
        bool show_version = false;
    };

    // Settings for the sample client that launches a server and calls one tool
    struct ClientConfig {
        std::filesystem::path server_path = "./appbridge_server";
        std::filesystem::path scripts_dir = "../AppScripts";
        std::string tool_name = "app.finder";
        std::optional<std::string> script;
        std::optional<std::filesystem::path> script_file;
        std::string protocol_version = kDefaultProtocolVersion;
        logging::LogLevel log_level = logging::LogLevel::INFO;
        bool show_help = false;
    };

    inline std::string to_string(const TransportKind kind) {
        switch (kind) {
            case TransportKind::Stdio:
                return "stdio";
            case TransportKind::UnixSocket:
                return "unix-socket";
            default:
                return "unknown";
        }
    }

} // namespace appbridge::core::config
