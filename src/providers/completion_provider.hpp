#pragma once

#include <functional>
#include <string>
#include <vector>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/loop_errors.hpp"
#include "protocol/message_contract.hpp"

namespace codeloop::providers {

struct CompletionRequest {
    std::string model;
    std::vector<protocol::ConversationMessage> messages;
    double temperature = 0.7;
};

enum class StreamStatus {
    Completed,  // end-of-stream reached
    Stopped     // the sink declined a fragment or the token was cancelled
};

// Receives text fragments in arrival order. Returning false stops the stream.
using FragmentSink = std::function<bool(const std::string& fragment)>;

// Streaming chat-completions contract. Implementations deliver fragments in
// order until exhaustion and report transport failures as
// ErrorCategory::Transport. They never retry.
class CompletionProvider {
public:
    virtual ~CompletionProvider() = default;

    virtual core::errors::Result<StreamStatus> stream(
        const CompletionRequest& request, const FragmentSink& on_fragment,
        const core::cancellation::CancelToken& cancel_token) = 0;
};

}  // namespace codeloop::providers
