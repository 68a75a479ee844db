#include "session/session_manager.hpp"
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace codeloop::session {

using core::errors::ErrorCategory;
using core::errors::LoopError;

std::string to_string(const SessionState state) {
    switch (state) {
        case SessionState::Created:
            return "created";
        case SessionState::Running:
            return "running";
        case SessionState::Completed:
            return "completed";
        case SessionState::Failed:
            return "failed";
        case SessionState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

bool SessionManager::is_terminal(const SessionState state) {
    return state == SessionState::Completed || state == SessionState::Failed ||
           state == SessionState::Cancelled;
}

core::errors::Result<std::string> SessionManager::start_session(const std::string& task) {
    if (task.find_first_not_of(" \t\r\n") == std::string::npos) {
        return LoopError{ErrorCategory::Input, "Session task cannot be empty.",
                         "invalid_session_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string session_id = core::config::generate_session_id();
        if (sessions_.find(session_id) != sessions_.end()) {
            continue;
        }

        SessionRecord record;
        record.session_id = session_id;
        record.task = task;
        record.cancel_token = core::cancellation::make_cancel_token();
        record.state = SessionState::Running;
        sessions_.emplace(session_id, std::move(record));
        LOG_INFO("SessionManager: session " + session_id + " transition created -> running");
        return session_id;
    }

    return LoopError{ErrorCategory::Internal, "Unable to allocate unique session ID.",
                     "session_id_generation_failed"};
}

core::errors::Result<SessionState> SessionManager::cancel_session(
    const std::string& session_id) {
    return transition_to_terminal(session_id, SessionState::Cancelled, std::nullopt, true);
}

core::errors::Result<SessionState> SessionManager::mark_completed(
    const std::string& session_id) {
    return transition_to_terminal(session_id, SessionState::Completed, std::nullopt, false);
}

core::errors::Result<SessionState> SessionManager::mark_failed(
    const std::string& session_id, const std::string& reason) {
    return transition_to_terminal(session_id, SessionState::Failed, reason, false);
}

core::errors::Result<SessionState> SessionManager::mark_cancelled(
    const std::string& session_id) {
    return transition_to_terminal(session_id, SessionState::Cancelled, std::nullopt, false);
}

core::errors::Result<SessionState> SessionManager::transition_to_terminal(
    const std::string& session_id, const SessionState next_state,
    const std::optional<std::string>& failure_reason, const bool signal_token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return LoopError{ErrorCategory::Input, "Session ID not found: " + session_id,
                         "session_not_found"};
    }

    if (is_terminal(it->second.state)) {
        return LoopError{ErrorCategory::Input,
                         "Session is already terminal: " + to_string(it->second.state),
                         "invalid_state_transition"};
    }

    if (signal_token) {
        core::cancellation::request_cancel(it->second.cancel_token);
    }
    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    LOG_INFO("SessionManager: session " + session_id + " transition " + prev + " -> " +
             to_string(next_state));
    return it->second.state;
}

core::errors::Result<SessionState> SessionManager::get_state(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return LoopError{ErrorCategory::Input, "Session ID not found: " + session_id,
                         "session_not_found"};
    }
    return it->second.state;
}

core::errors::Result<core::cancellation::CancelToken> SessionManager::get_cancel_token(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return LoopError{ErrorCategory::Input, "Session ID not found: " + session_id,
                         "session_not_found"};
    }
    return it->second.cancel_token;
}

std::optional<std::string> SessionManager::failure_reason(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.failure_reason;
}

std::size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace codeloop::session
