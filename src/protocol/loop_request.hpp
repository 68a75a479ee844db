#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "protocol/message_contract.hpp"

namespace codeloop::protocol {

    // Everything one invocation of the step loop needs besides its collaborators.
    struct LoopRequest {
        std::vector<ConversationMessage> history;
        std::string instructions;           // prepended to the grammar preamble
        std::string model = "llama3.1:latest";
        double temperature = 0.7;
        uint32_t max_steps = 10;
        uint32_t max_reminders = 0;         // consecutive tag-less rounds; 0 = unbounded
    };

    enum class OutcomeReason {
        Finished,
        StepLimit,
        ReminderLimit,
        Cancelled
    };

    struct LoopOutcome {
        OutcomeReason reason = OutcomeReason::Finished;
        uint32_t steps_taken = 0;
        std::string final_content;
        std::vector<std::string> commit_ids;
        std::vector<ConversationMessage> conversation;
    };

    inline std::string to_string(const OutcomeReason reason) {
        switch (reason) {
            case OutcomeReason::Finished:
                return "finished";
            case OutcomeReason::StepLimit:
                return "step_limit";
            case OutcomeReason::ReminderLimit:
                return "reminder_limit";
            case OutcomeReason::Cancelled:
                return "cancelled";
            default:
                return "unknown";
        }
    }

} // namespace codeloop::protocol
