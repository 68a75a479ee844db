#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/loop_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/loop_request.hpp"
#include "providers/completion_provider.hpp"
#include "tools/code_executor.hpp"

namespace codeloop::runtime {

// Receives events in protocol order; called on the invoking thread.
using EventSink = std::function<void(const protocol::LoopEvent&)>;

// Optional host callbacks, fired synchronously as milestones occur.
struct LoopObserver {
    std::function<void(const std::string& round_id, const std::string& final_text,
                       const std::vector<std::string>& commit_ids)>
        on_message;
    std::function<void(const std::string& round_id, const std::string& partial_text)>
        on_streaming;
};

struct LoopState {
    std::uint32_t step_count = 0;
    std::uint32_t max_steps = 0;
    bool cancelled = false;
};

// Drives request -> stream -> extract -> (execute -> request)* -> done.
//
// Transport failures come back as an error result. Everything else, including
// cancellation and the step limit, ends in a LoopOutcome.
class StepOrchestrator {
public:
    StepOrchestrator(providers::CompletionProvider& provider,
                     tools::CodeExecutor& executor);

    // A null token is replaced by a fresh one for this invocation.
    core::errors::Result<protocol::LoopOutcome> run(
        const protocol::LoopRequest& request, const EventSink& emit,
        core::cancellation::CancelToken cancel_token = nullptr,
        const LoopObserver& observer = {}) const;

private:
    providers::CompletionProvider& provider_;
    tools::CodeExecutor& executor_;
};

}  // namespace codeloop::runtime
