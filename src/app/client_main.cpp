#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "client/server_process.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"

namespace {

appbridge::core::errors::Result<std::string> load_script(
    const appbridge::core::config::ClientConfig& config) {
    if (config.script.has_value()) {
        return config.script.value();
    }

    const auto& path = config.script_file.value();
    if (path.string() == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return appbridge::core::errors::BridgeError{
            appbridge::core::errors::ErrorCategory::Input,
            "Failed to open script file: " + path.string(), "invalid_path"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = appbridge::app::cli::parse_client_args(argc, argv);
    if (appbridge::core::errors::is_error(parsed)) {
        const auto& err = appbridge::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& config = appbridge::core::errors::get_value(parsed);
    if (config.show_help) {
        std::cout << appbridge::app::cli::client_usage();
        return 0;
    }
    appbridge::core::logging::Logger::get().set_min_level(config.log_level);
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));

    auto script_result = load_script(config);
    if (appbridge::core::errors::is_error(script_result)) {
        const auto& err = appbridge::core::errors::get_error(script_result);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        return 2;
    }
    const std::string& script = appbridge::core::errors::get_value(script_result);

    std::vector<std::string> server_argv = {config.server_path.string(), "--transport",
                                            "stdio", "--scripts-dir",
                                            config.scripts_dir.string()};
    auto spawned = appbridge::client::ServerProcess::spawn(server_argv);
    if (appbridge::core::errors::is_error(spawned)) {
        const auto& err = appbridge::core::errors::get_error(spawned);
        LOG_ERROR("Failed to start server [" + err.code + "]: " + err.message);
        return 3;
    }
    // Owns the child: leaving this scope kills and reaps it.
    auto server = std::move(appbridge::core::errors::get_value(spawned));

    nlohmann::json client_info;
    client_info["name"] = "appbridge-client";
    client_info["version"] = appbridge::core::config::kProjectVersion;
    nlohmann::json init_params;
    init_params["client"] = client_info;
    init_params["protocol_version"] = config.protocol_version;

    auto sent = server->send_request(1, "initialize", init_params);
    if (appbridge::core::errors::is_error(sent)) {
        LOG_ERROR("Failed to send initialize: " + appbridge::core::errors::get_error(sent).message);
        return 4;
    }
    auto init_response = server->read_response();
    if (appbridge::core::errors::is_error(init_response)) {
        LOG_ERROR("Failed to read initialize response: " +
                  appbridge::core::errors::get_error(init_response).message);
        return 4;
    }

    nlohmann::json call_params;
    call_params["name"] = config.tool_name;
    call_params["arguments"] = nlohmann::json{{"script", script}};
    sent = server->send_request(2, "tools/call", call_params);
    if (appbridge::core::errors::is_error(sent)) {
        LOG_ERROR("Failed to send tools/call: " + appbridge::core::errors::get_error(sent).message);
        return 4;
    }
    auto tool_response = server->read_response();
    if (appbridge::core::errors::is_error(tool_response)) {
        LOG_ERROR("Failed to read tools/call response: " +
                  appbridge::core::errors::get_error(tool_response).message);
        return 4;
    }

    server->shutdown();

    std::cout << "Script:\n" << script << "\n\n";
    std::cout << "Initialize response:\n"
              << appbridge::core::errors::get_value(init_response) << "\n\n";
    std::cout << "tools/call response:\n"
              << appbridge::core::errors::get_value(tool_response) << std::endl;
    return 0;
}
