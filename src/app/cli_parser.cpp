#include "app/cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <system_error>
#include <vector>

namespace appbridge::app::cli {

    using namespace appbridge::core::errors;
    using appbridge::core::config::ClientConfig;
    using appbridge::core::config::ServerConfig;
    using appbridge::core::config::TransportKind;
    using appbridge::core::logging::LogLevel;

    namespace {

    constexpr std::uint32_t kMaxTimeoutMs = 3600000;
    constexpr std::size_t kMinFrameBytes = 1024;

    // 1. Raw Options Struct (Internal only)
    struct RawServerOptions {
        std::optional<std::string> transport;
        std::optional<std::string> socket_path;
        std::optional<std::string> scripts_dir;
        std::optional<std::string> interpreter;
        std::vector<std::string> interpreter_args;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> max_frame_bytes;
        std::optional<std::string> log_level;
        bool allow_shell_scripts = false;
        bool help = false;
        bool version = false;
    };

    std::vector<std::string> collect_args(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }
        return args;
    }

    BridgeError missing_value(const std::string& flag) {
        return BridgeError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
    }

    // Exception-free integer parsing
    template <typename T>
    Result<T> parse_number(const std::string& flag, const std::string& text) {
        T value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end || text.empty()) {
            return BridgeError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
        }
        return value;
    }

    Result<LogLevel> parse_log_level(const std::string& text) {
        auto level = appbridge::core::logging::parse_level(text);
        if (!level) {
            return BridgeError{ErrorCategory::Input, "Unknown log level: " + text, "invalid_log_level", "Use debug, info, warn or error."};
        }
        return *level;
    }

    // --log-level wins; APPBRIDGE_LOG is the fallback.
    Result<LogLevel> resolve_log_level(const std::optional<std::string>& flag) {
        if (flag) {
            return parse_log_level(*flag);
        }
        const char* env = std::getenv("APPBRIDGE_LOG");
        if (env != nullptr && *env != '\0') {
            return parse_log_level(env);
        }
        return LogLevel::INFO;
    }

    } // namespace

    Result<ServerConfig> parse_server_args(int argc, char* argv[]) {
        RawServerOptions raw;
        const std::vector<std::string> args = collect_args(argc, argv);

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--transport") {
                if (i + 1 < args.size()) raw.transport = args[++i];
                else return missing_value("--transport");
            } else if (args[i] == "--socket-path") {
                if (i + 1 < args.size()) raw.socket_path = args[++i];
                else return missing_value("--socket-path");
            } else if (args[i] == "--scripts-dir") {
                if (i + 1 < args.size()) raw.scripts_dir = args[++i];
                else return missing_value("--scripts-dir");
            } else if (args[i] == "--interpreter") {
                if (i + 1 < args.size()) raw.interpreter = args[++i];
                else return missing_value("--interpreter");
            } else if (args[i] == "--interpreter-arg") {
                if (i + 1 < args.size()) raw.interpreter_args.push_back(args[++i]);
                else return missing_value("--interpreter-arg");
            } else if (args[i] == "--timeout-ms") {
                if (i + 1 < args.size()) raw.timeout_ms = args[++i];
                else return missing_value("--timeout-ms");
            } else if (args[i] == "--max-frame-bytes") {
                if (i + 1 < args.size()) raw.max_frame_bytes = args[++i];
                else return missing_value("--max-frame-bytes");
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return missing_value("--log-level");
            } else if (args[i] == "--allow-shell-scripts") {
                raw.allow_shell_scripts = true;
            } else if (args[i] == "--help" || args[i] == "-h") {
                raw.help = true;
            } else if (args[i] == "--version") {
                raw.version = true;
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", "Run with --help for usage."};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerConfig config;
        config.show_help = raw.help;
        config.show_version = raw.version;
        config.allow_shell_scripts = raw.allow_shell_scripts;

        if (raw.transport) {
            if (*raw.transport == "stdio") {
                config.transport = TransportKind::Stdio;
            } else if (*raw.transport == "unix-socket") {
                config.transport = TransportKind::UnixSocket;
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown transport: " + *raw.transport, "invalid_transport", "Use stdio or unix-socket."};
            }
        }
        if (raw.socket_path) config.socket_path = std::filesystem::path(raw.socket_path.value());
        if (config.transport == TransportKind::UnixSocket && !config.socket_path) {
            return BridgeError{ErrorCategory::Input, "--socket-path is required when using --transport unix-socket", "missing_socket_path"};
        }

        if (raw.scripts_dir) config.scripts_dir = std::filesystem::path(raw.scripts_dir.value());
        if (raw.interpreter) {
            if (raw.interpreter->empty()) {
                return BridgeError{ErrorCategory::Input, "--interpreter cannot be empty", "missing_value"};
            }
            config.interpreter = raw.interpreter.value();
        }
        if (!raw.interpreter_args.empty()) config.interpreter_args = raw.interpreter_args;

        if (raw.timeout_ms) {
            auto timeout = parse_number<std::uint32_t>("--timeout-ms", *raw.timeout_ms);
            if (is_error(timeout)) return get_error(timeout);
            if (get_value(timeout) > kMaxTimeoutMs) {
                return BridgeError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be between 0 (no deadline) and 3600000."};
            }
            config.timeout_ms = get_value(timeout);
        }

        if (raw.max_frame_bytes) {
            auto limit = parse_number<std::size_t>("--max-frame-bytes", *raw.max_frame_bytes);
            if (is_error(limit)) return get_error(limit);
            if (get_value(limit) < kMinFrameBytes) {
                return BridgeError{ErrorCategory::Input, "--max-frame-bytes out of bounds", "bounds_error", "Must be at least 1024."};
            }
            config.max_frame_bytes = get_value(limit);
        }

        auto level = resolve_log_level(raw.log_level);
        if (is_error(level)) return get_error(level);
        config.log_level = get_value(level);

        return config;
    }

    Result<ClientConfig> parse_client_args(int argc, char* argv[]) {
        ClientConfig config;
        std::optional<std::string> log_level;
        const std::vector<std::string> args = collect_args(argc, argv);

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--server-path") {
                if (i + 1 < args.size()) config.server_path = args[++i];
                else return missing_value("--server-path");
            } else if (args[i] == "--scripts-dir") {
                if (i + 1 < args.size()) config.scripts_dir = args[++i];
                else return missing_value("--scripts-dir");
            } else if (args[i] == "--tool") {
                if (i + 1 < args.size()) config.tool_name = args[++i];
                else return missing_value("--tool");
            } else if (args[i] == "--script") {
                if (i + 1 < args.size()) config.script = args[++i];
                else return missing_value("--script");
            } else if (args[i] == "--script-file") {
                if (i + 1 < args.size()) config.script_file = std::filesystem::path(args[++i]);
                else return missing_value("--script-file");
            } else if (args[i] == "--protocol-version") {
                if (i + 1 < args.size()) config.protocol_version = args[++i];
                else return missing_value("--protocol-version");
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) log_level = args[++i];
                else return missing_value("--log-level");
            } else if (args[i] == "--help" || args[i] == "-h") {
                config.show_help = true;
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", "Run with --help for usage."};
            }
        }

        if (config.show_help) {
            return config;
        }

        // Mutual Exclusion XOR check
        if (!config.script.has_value() && !config.script_file.has_value()) {
            return BridgeError{ErrorCategory::Input, "Must provide either --script or --script-file", "missing_required_flag"};
        }
        if (config.script.has_value() && config.script_file.has_value()) {
            return BridgeError{ErrorCategory::Input, "Cannot provide both --script and --script-file", "conflicting_flags"};
        }
        if (config.tool_name.empty()) {
            return BridgeError{ErrorCategory::Input, "--tool cannot be empty", "missing_value"};
        }

        auto level = resolve_log_level(log_level);
        if (is_error(level)) return get_error(level);
        config.log_level = get_value(level);

        return config;
    }

    std::string server_usage() {
        return "Usage: appbridge_server [options]\n"
               "  --transport stdio|unix-socket   JSON-RPC framing transport (default stdio)\n"
               "  --socket-path PATH              Socket path for --transport unix-socket\n"
               "  --scripts-dir DIR               Catalog root (default ../AppScripts)\n"
               "  --interpreter PATH              Script interpreter (default osascript)\n"
               "  --interpreter-arg ARG           Argument placed before the program (repeatable, default -e)\n"
               "  --timeout-ms N                  Per-call deadline, 0 disables (default 30000)\n"
               "  --max-frame-bytes N             Largest accepted frame payload (default 16777216)\n"
               "  --allow-shell-scripts           Do not block 'do shell script'\n"
               "  --log-level LEVEL               debug, info, warn or error (env APPBRIDGE_LOG)\n"
               "  --version                       Print the version and exit\n";
    }

    std::string client_usage() {
        return "Usage: appbridge_client (--script TEXT | --script-file PATH) [options]\n"
               "  --server-path PATH       Server executable (default ./appbridge_server)\n"
               "  --scripts-dir DIR        Catalog root passed to the server (default ../AppScripts)\n"
               "  --tool NAME              Tool to call (default app.finder)\n"
               "  --script TEXT            Script body to run\n"
               "  --script-file PATH       Read the script body from PATH ('-' for stdin)\n"
               "  --protocol-version V     Requested protocol version (default 2024-10-30)\n"
               "  --log-level LEVEL        debug, info, warn or error (env APPBRIDGE_LOG)\n";
    }

} // namespace appbridge::app::cli
