#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/loop_errors.hpp"

namespace codeloop::session {

enum class SessionState {
    Created,
    Running,
    Completed,
    Failed,
    Cancelled
};

struct SessionRecord {
    std::string session_id;
    std::string task;
    SessionState state = SessionState::Created;
    std::optional<std::string> failure_reason;
    core::cancellation::CancelToken cancel_token;
};

std::string to_string(SessionState state);

// Tracks loop invocations and owns their cancellation tokens.
class SessionManager {
public:
    core::errors::Result<std::string> start_session(const std::string& task);
    core::errors::Result<SessionState> cancel_session(const std::string& session_id);
    core::errors::Result<SessionState> get_state(const std::string& session_id) const;
    core::errors::Result<core::cancellation::CancelToken> get_cancel_token(
        const std::string& session_id) const;

    core::errors::Result<SessionState> mark_completed(const std::string& session_id);
    core::errors::Result<SessionState> mark_failed(const std::string& session_id,
                                                   const std::string& reason);
    // Records a cancellation the loop already observed, without touching the token.
    core::errors::Result<SessionState> mark_cancelled(const std::string& session_id);

    std::optional<std::string> failure_reason(const std::string& session_id) const;
    std::size_t session_count() const;

private:
    core::errors::Result<SessionState> transition_to_terminal(
        const std::string& session_id, SessionState next_state,
        const std::optional<std::string>& failure_reason, bool signal_token);
    static bool is_terminal(SessionState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionRecord> sessions_;
};

}  // namespace codeloop::session
