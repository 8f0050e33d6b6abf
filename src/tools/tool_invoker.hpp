#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "policy/script_policy.hpp"
#include "tools/tool_registry.hpp"

namespace appbridge::tools {

struct InvocationOptions {
    std::string interpreter = "osascript";
    std::vector<std::string> interpreter_args = {"-e"};
    std::uint32_t timeout_ms = 30000;  // 0 disables the deadline
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Captured result of one interpreter run.
struct InvocationOutcome {
    bool success = false;
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Escapes `\` and `"` for use inside an AppleScript string literal.
std::string escape_app_name(const std::string& app_name);

// tell application "<app>"
// <script, newline-terminated>
// end tell
std::string compose_program(const Tool& tool, const std::string& script);

class ToolInvoker {
public:
    explicit ToolInvoker(InvocationOptions options = {},
                         policy::ScriptPolicy script_policy = policy::ScriptPolicy{});

    // Policy check and composition, without running anything. Errors are of
    // category Policy.
    core::errors::Result<std::string> prepare(const Tool& tool,
                                              const std::string& script) const;

    // Runs the composed program once and waits for it. A nonzero exit is a
    // successful invocation with outcome.success == false; only policy
    // rejections and failures to start the interpreter are errors.
    core::errors::Result<InvocationOutcome> invoke(const Tool& tool,
                                                   const std::string& script) const;

    const InvocationOptions& options() const { return options_; }

private:
    InvocationOptions options_;
    policy::ScriptPolicy script_policy_;
};

}  // namespace appbridge::tools
