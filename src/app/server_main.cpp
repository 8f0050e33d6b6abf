#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <utility>
#include "app/cli_parser.hpp"
#include "core/config/server_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/script_policy.hpp"
#include "server/dispatcher.hpp"
#include "session/session.hpp"
#include "tools/tool_invoker.hpp"
#include "tools/tool_registry.hpp"
#include "transport/transport_factory.hpp"

namespace {

std::atomic_bool* g_stop_flag = nullptr;

extern "C" void handle_stop_signal(int) {
    if (g_stop_flag != nullptr) {
        g_stop_flag->store(true);
    }
}

// No SA_RESTART: a blocking read on stdin must come back with EINTR.
void install_signal_handlers(const std::shared_ptr<std::atomic_bool>& stop_token) {
    g_stop_flag = stop_token.get();

    struct sigaction action {};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    static_cast<void>(sigaction(SIGINT, &action, nullptr));
    static_cast<void>(sigaction(SIGTERM, &action, nullptr));

    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log line with this connection's session ID
    const std::string session_id = appbridge::core::config::generate_session_id();
    appbridge::core::logging::Logger::get().set_session_id(session_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = appbridge::app::cli::parse_server_args(argc, argv);
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
        std::cout << appbridge::app::cli::server_usage();
        return 0;
    }
    if (config.show_version) {
        std::cout << appbridge::core::config::kProjectName << " "
                  << appbridge::core::config::kProjectVersion << std::endl;
        return 0;
    }
    appbridge::core::logging::Logger::get().set_min_level(config.log_level);
    LOG_INFO("Starting " + std::string(appbridge::core::config::kProjectName) + " " +
             appbridge::core::config::kProjectVersion + " on " +
             appbridge::core::config::to_string(config.transport));

    auto stop_token = std::make_shared<std::atomic_bool>(false);
    install_signal_handlers(stop_token);

    // 3. Build the catalog once; a scan error is fatal
    auto registry_result = appbridge::tools::ToolRegistry::load(config.scripts_dir);
    if (appbridge::core::errors::is_error(registry_result)) {
        const auto& err = appbridge::core::errors::get_error(registry_result);
        LOG_ERROR("Failed to load tools [" + err.code + "]: " + err.message);
        return 3;
    }
    const auto& registry = appbridge::core::errors::get_value(registry_result);

    // 4. Select the transport
    auto transport_result = appbridge::transport::create_transport(config, stop_token);
    if (appbridge::core::errors::is_error(transport_result)) {
        const auto& err = appbridge::core::errors::get_error(transport_result);
        LOG_ERROR("Failed to create transport [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 4;
    }
    auto transport = std::move(appbridge::core::errors::get_value(transport_result));

    appbridge::policy::ScriptRules rules;
    if (config.allow_shell_scripts) {
        rules.blocked_substrings.clear();
    }
    appbridge::tools::InvocationOptions invocation;
    invocation.interpreter = config.interpreter;
    invocation.interpreter_args = config.interpreter_args;
    invocation.timeout_ms = config.timeout_ms;
    invocation.cancel_token = stop_token;
    const appbridge::tools::ToolInvoker invoker(invocation,
                                                appbridge::policy::ScriptPolicy(rules));

    auto options = appbridge::server::default_dispatcher_options();
    options.stop_token = stop_token;
    appbridge::server::Dispatcher dispatcher(*transport, registry, invoker, options);

    // 5. Serve until the client hangs up
    appbridge::session::Session session(session_id);
    auto served = dispatcher.run(session);
    if (appbridge::core::errors::is_error(served)) {
        const auto& err = appbridge::core::errors::get_error(served);
        LOG_ERROR("Server stopped on fatal error [" + err.code + "]: " + err.message);
        return 1;
    }

    LOG_INFO("Processed " + std::to_string(appbridge::core::errors::get_value(served)) +
             " frames; final session state: " +
             appbridge::session::Session::to_string(session.state()));
    return 0;
}
