#pragma once

#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace appbridge::policy {

struct ScriptRules {
    // Matched case-insensitively anywhere in the script, with whitespace
    // runs and line continuations read as a single space.
    std::vector<std::string> blocked_substrings = {"do shell script"};
};

// Gatekeeper between caller-supplied script text and the interpreter.
class ScriptPolicy {
public:
    explicit ScriptPolicy(ScriptRules rules = {});

    // Rejects NUL bytes, blocked operations and any line that would close
    // the application block the script is wrapped in. CR, LF and CRLF all
    // end a line; strings, comments and line continuations are resolved
    // first.
    core::errors::Result<std::string> validate_script(const std::string& script) const;

    // Rejects control characters, which cannot appear in the quoted
    // application name.
    core::errors::Result<std::string> validate_app_name(const std::string& app_name) const;

private:
    static std::string lowercase(std::string value);
    static std::string strip_quotes_and_comments(const std::string& script);
    static std::string collapse_whitespace(const std::string& text);
    static int block_delta(const std::string& line);

    ScriptRules rules_;
};

}  // namespace appbridge::policy
