#pragma once
#include <string>
#include <variant>

namespace appbridge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., an invalid CLI flag
        Framing,    // E.g., a frame without Content-Length; the frame is dropped
        Protocol,   // E.g., a payload that is not a JSON-RPC request
        Policy,     // E.g., a script that tries to leave its application block
        Transport,  // E.g., stdin/stdout I/O failure; ends the session
        Internal    // E.g., fork failed or JSON could not be serialized
    };

    // The standardized error payload
    struct BridgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Framing: return "framing";
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Policy: return "policy";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

    // Framing and Protocol errors cost only the current frame; everything
    // else on the read/write path ends the session.
    inline bool is_recoverable(const BridgeError& error) {
        return error.category == ErrorCategory::Framing ||
               error.category == ErrorCategory::Protocol;
    }

} // namespace appbridge::core::errors
