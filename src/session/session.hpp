#pragma once

#include <mutex>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace appbridge::session {

enum class SessionState {
    Uninitialized,
    Initialized
};

// Per-connection state. Created when the connection starts, moves to
// Initialized at most once and never back.
class Session {
public:
    explicit Session(std::string session_id);

    const std::string& id() const { return session_id_; }

    SessionState state() const;
    bool is_initialized() const;

    // Uninitialized -> Initialized. Fails with "invalid_state_transition" if
    // the session is already initialized.
    core::errors::Result<SessionState> mark_initialized();

    static std::string to_string(SessionState state);

private:
    std::string session_id_;
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Uninitialized;
};

}  // namespace appbridge::session
