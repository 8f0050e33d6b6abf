#include "policy/script_policy.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace appbridge::policy {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

// "¬" in UTF-8; followed by a line break it joins two lines.
constexpr char kContinuationLead = '\xC2';
constexpr char kContinuationTrail = '\xAC';

bool is_line_break(const char c) {
    return c == '\n' || c == '\r';
}

bool starts_with_word(const std::string& line, const std::string& word) {
    if (line.compare(0, word.size(), word) != 0) {
        return false;
    }
    return line.size() == word.size() ||
           std::isspace(static_cast<unsigned char>(line[word.size()])) != 0;
}

bool ends_with_word(const std::string& line, const std::string& word) {
    if (line.size() < word.size() ||
        line.compare(line.size() - word.size(), word.size(), word) != 0) {
        return false;
    }
    return line.size() == word.size() ||
           std::isspace(static_cast<unsigned char>(line[line.size() - word.size() - 1])) != 0;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

// If a continuation mark starts at `pos` and only blanks separate it from a
// line break, returns the index of the last byte of that break.
std::size_t continuation_end(const std::string& text, const std::size_t pos) {
    if (pos + 1 >= text.size() || text[pos] != kContinuationLead ||
        text[pos + 1] != kContinuationTrail) {
        return std::string::npos;
    }
    std::size_t i = pos + 2;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) {
        ++i;
    }
    if (i >= text.size() || !is_line_break(text[i])) {
        return std::string::npos;
    }
    if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
    }
    return i;
}

// Splits on CR, LF and CRLF.
std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (!is_line_break(c)) {
            current.push_back(c);
            continue;
        }
        if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            ++i;
        }
        lines.push_back(std::move(current));
        current.clear();
    }
    lines.push_back(std::move(current));
    return lines;
}

}  // namespace

ScriptPolicy::ScriptPolicy(ScriptRules rules) : rules_(std::move(rules)) {}

std::string ScriptPolicy::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

// Leaves only code: string literals become a blank, "--" and "#" comments
// run to the end of the line, "(* *)" comments nest and may span lines, and
// a continuation mark joins its line with the next. Line breaks outside
// continuations are kept so line numbers still mean something.
std::string ScriptPolicy::strip_quotes_and_comments(const std::string& script) {
    std::string out;
    out.reserve(script.size());
    bool in_string = false;
    bool in_line_comment = false;
    int comment_depth = 0;

    for (std::size_t i = 0; i < script.size(); ++i) {
        const char c = script[i];
        const char next = i + 1 < script.size() ? script[i + 1] : '\0';

        if (in_line_comment) {
            if (is_line_break(c)) {
                in_line_comment = false;
                out.push_back(c);
            }
            continue;
        }
        if (comment_depth > 0) {
            if (c == '(' && next == '*') {
                ++comment_depth;
                ++i;
            } else if (c == '*' && next == ')') {
                --comment_depth;
                ++i;
                if (comment_depth == 0) {
                    out.push_back(' ');
                }
            } else if (is_line_break(c)) {
                out.push_back(c);
            }
            continue;
        }
        if (in_string) {
            if (c == '\\' && i + 1 < script.size()) {
                ++i;
            } else if (c == '"') {
                in_string = false;
            } else if (is_line_break(c)) {
                out.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
            out.push_back(' ');
            continue;
        }
        if (c == '(' && next == '*') {
            comment_depth = 1;
            ++i;
            continue;
        }
        if (c == '#' || (c == '-' && next == '-')) {
            in_line_comment = true;
            continue;
        }
        const std::size_t joined = continuation_end(script, i);
        if (joined != std::string::npos) {
            out.push_back(' ');
            i = joined;
            continue;
        }
        out.push_back(c);
    }
    return out;
}

// Runs of whitespace, including continuation marks with their line break,
// become one space.
std::string ScriptPolicy::collapse_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const std::size_t joined = continuation_end(text, i);
        if (joined != std::string::npos) {
            pending_space = true;
            i = joined;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(text[i])) != 0) {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty()) {
            out.push_back(' ');
        }
        pending_space = false;
        out.push_back(text[i]);
    }
    return out;
}

// +1 for a line that opens a block, -1 for one that closes a block. The line
// has already been through strip_quotes_and_comments.
int ScriptPolicy::block_delta(const std::string& code_line) {
    const std::string line = trim(lowercase(code_line));
    if (line.empty()) {
        return 0;
    }
    if (starts_with_word(line, "end")) {
        return -1;
    }
    if (starts_with_word(line, "tell")) {
        return line.find(" to ") == std::string::npos ? 1 : 0;
    }
    if (starts_with_word(line, "if")) {
        return ends_with_word(line, "then") ? 1 : 0;
    }
    if (starts_with_word(line, "on")) {
        // "on error" continues a try block.
        return starts_with_word(trim(line.substr(2)), "error") ? 0 : 1;
    }
    static const char* const kOpeners[] = {"repeat", "try", "considering", "ignoring",
                                           "to", "script"};
    for (const char* opener : kOpeners) {
        if (starts_with_word(line, opener)) {
            return 1;
        }
    }
    if (line.rfind("using terms from", 0) == 0 || line.rfind("with timeout", 0) == 0 ||
        line.rfind("with transaction", 0) == 0) {
        return 1;
    }
    return 0;
}

core::errors::Result<std::string> ScriptPolicy::validate_script(
    const std::string& script) const {
    if (script.find('\0') != std::string::npos) {
        return BridgeError{ErrorCategory::Policy, "Script contains a NUL byte.",
                           "script_contains_nul"};
    }

    const std::string code = strip_quotes_and_comments(script);

    // The raw text catches blocked operations hidden in strings handed to
    // "run script"; the stripped text catches ones split by comments.
    const std::string raw_text = collapse_whitespace(lowercase(script));
    const std::string code_text = collapse_whitespace(lowercase(code));
    for (const auto& blocked : rules_.blocked_substrings) {
        const std::string needle = collapse_whitespace(lowercase(blocked));
        if (needle.empty()) {
            continue;
        }
        if (raw_text.find(needle) == std::string::npos &&
            code_text.find(needle) == std::string::npos) {
            continue;
        }
        return BridgeError{ErrorCategory::Policy,
                           "Script contains blocked operation: " + blocked,
                           "script_blocked_operation"};
    }

    int depth = 0;
    std::size_t line_no = 0;
    for (const auto& line : split_lines(code)) {
        ++line_no;
        depth += block_delta(line);
        if (depth < 0) {
            return BridgeError{ErrorCategory::Policy,
                               "Script line " + std::to_string(line_no) +
                                   " closes the enclosing application block.",
                               "script_escapes_block",
                               "Balance every 'end' with a block opened inside the script."};
        }
    }
    return script;
}

core::errors::Result<std::string> ScriptPolicy::validate_app_name(
    const std::string& app_name) const {
    for (const char raw : app_name) {
        const auto c = static_cast<unsigned char>(raw);
        if (c < 0x20 || c == 0x7f) {
            return BridgeError{ErrorCategory::Policy,
                               "Application name contains a control character.",
                               "invalid_app_name"};
        }
    }
    return app_name;
}

}  // namespace appbridge::policy
