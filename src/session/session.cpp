#include "session/session.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace appbridge::session {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

Session::Session(std::string session_id) : session_id_(std::move(session_id)) {}

std::string Session::to_string(const SessionState state) {
    switch (state) {
        case SessionState::Uninitialized:
            return "uninitialized";
        case SessionState::Initialized:
            return "initialized";
        default:
            return "unknown";
    }
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Session::is_initialized() const {
    return state() == SessionState::Initialized;
}

core::errors::Result<SessionState> Session::mark_initialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Initialized) {
        return BridgeError{ErrorCategory::Protocol,
                           "Session " + session_id_ + " is already initialized.",
                           "invalid_state_transition"};
    }

    const std::string prev = to_string(state_);
    state_ = SessionState::Initialized;
    LOG_INFO("Session: " + session_id_ + " transition " + prev + " -> " +
             to_string(state_));
    return state_;
}

}  // namespace appbridge::session
