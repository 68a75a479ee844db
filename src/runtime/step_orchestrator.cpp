#include "runtime/step_orchestrator.hpp"

#include <optional>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "parser/tag_grammar.hpp"
#include "protocol/prompts.hpp"

namespace codeloop::runtime {

using core::cancellation::is_cancelled;
using core::errors::ErrorCategory;
using core::errors::LoopError;
using protocol::ConversationMessage;
using protocol::FunctionCallEvent;
using protocol::FunctionCallOutputEvent;
using protocol::LoopOutcome;
using protocol::LoopRequest;
using protocol::NewCompletionEvent;
using protocol::OutcomeReason;
using protocol::Role;
using protocol::TextEvent;
using providers::CompletionRequest;
using providers::StreamStatus;

namespace {

struct Round {
    std::string id;
    std::string buffer;
};

LoopOutcome& finish(LoopOutcome& outcome, const LoopState& state,
                    const OutcomeReason reason) {
    outcome.reason = reason;
    outcome.steps_taken = state.step_count;
    return outcome;
}

CompletionRequest build_completion_request(const LoopRequest& request,
                                           const std::string& system_prompt,
                                           const std::vector<ConversationMessage>& conversation) {
    CompletionRequest completion;
    completion.model = request.model;
    completion.temperature = request.temperature;
    completion.messages.reserve(conversation.size() + 1);
    completion.messages.push_back({Role::System, system_prompt, std::nullopt});
    completion.messages.insert(completion.messages.end(), conversation.begin(),
                               conversation.end());
    return completion;
}

}  // namespace

StepOrchestrator::StepOrchestrator(providers::CompletionProvider& provider,
                                   tools::CodeExecutor& executor)
    : provider_(provider), executor_(executor) {}

core::errors::Result<LoopOutcome> StepOrchestrator::run(
    const LoopRequest& request, const EventSink& emit,
    core::cancellation::CancelToken cancel_token,
    const LoopObserver& observer) const {
    if (!cancel_token) {
        cancel_token = core::cancellation::make_cancel_token();
    }

    LoopOutcome outcome;
    outcome.conversation = request.history;

    LoopState state;
    state.max_steps = request.max_steps;

    if (is_cancelled(cancel_token)) {
        state.cancelled = true;
        return finish(outcome, state, OutcomeReason::Cancelled);
    }
    if (request.max_steps == 0) {
        return LoopError{ErrorCategory::Input, "max_steps must be greater than zero.",
                         "invalid_max_steps"};
    }

    const std::string system_prompt = protocol::prompts::build_system_prompt(request.instructions);
    std::uint32_t consecutive_reminders = 0;

    while (true) {
        Round round;
        round.id = core::config::generate_round_id();
        LOG_DEBUG("StepOrchestrator: round " + round.id + " requesting (step " +
                  std::to_string(state.step_count) + "/" +
                  std::to_string(state.max_steps) + ")");

        const CompletionRequest completion =
            build_completion_request(request, system_prompt, outcome.conversation);
        emit(NewCompletionEvent{round.id});

        auto on_fragment = [&](const std::string& fragment) {
            if (is_cancelled(cancel_token)) {
                state.cancelled = true;
                return false;
            }
            round.buffer += fragment;
            emit(TextEvent{round.buffer});
            if (observer.on_streaming) {
                observer.on_streaming(round.id, round.buffer);
            }
            return true;
        };

        auto streamed = provider_.stream(completion, on_fragment, cancel_token);
        if (core::errors::is_error(streamed)) {
            const auto& err = core::errors::get_error(streamed);
            LOG_ERROR("StepOrchestrator: round " + round.id + " stream failed [" +
                      err.code + "]: " + err.message);
            return err;
        }
        if (state.cancelled ||
            core::errors::get_value(streamed) == StreamStatus::Stopped) {
            LOG_INFO("StepOrchestrator: round " + round.id + " cancelled while streaming");
            state.cancelled = true;
            return finish(outcome, state, OutcomeReason::Cancelled);
        }

        // A final answer wins even when the same buffer also holds a script.
        if (auto final_segment = parser::extract_final(round.buffer)) {
            emit(TextEvent{final_segment->content, true});
            if (observer.on_message) {
                observer.on_message(round.id, final_segment->content,
                                    final_segment->commit_ids);
            }
            LOG_INFO("StepOrchestrator: round " + round.id + " produced a final response (" +
                     std::to_string(final_segment->commit_ids.size()) + " commit ids)");
            outcome.final_content = std::move(final_segment->content);
            outcome.commit_ids = std::move(final_segment->commit_ids);
            return finish(outcome, state, OutcomeReason::Finished);
        }

        if (auto action = parser::extract_action(round.buffer, round.id)) {
            consecutive_reminders = 0;

            std::string assistant_turn;
            if (const auto thoughts = parser::extract_thoughts_block(round.buffer)) {
                assistant_turn = *thoughts + "\n";
            }
            assistant_turn += action->raw;
            outcome.conversation.push_back({Role::Assistant, std::move(assistant_turn),
                                            std::nullopt});

            emit(FunctionCallEvent{protocol::kRunCodeToolName, action->code, action->id});

            if (is_cancelled(cancel_token)) {
                LOG_INFO("StepOrchestrator: round " + round.id +
                         " cancelled before running the script");
                state.cancelled = true;
                return finish(outcome, state, OutcomeReason::Cancelled);
            }

            const std::string result =
                executor_.execute_code(action->id, action->code, cancel_token);

            // The script ran to completion; only what follows is suppressed.
            if (is_cancelled(cancel_token)) {
                LOG_INFO("StepOrchestrator: round " + round.id +
                         " cancelled while the script was running");
                state.cancelled = true;
                return finish(outcome, state, OutcomeReason::Cancelled);
            }

            emit(FunctionCallOutputEvent{result, action->id});
            outcome.conversation.push_back({Role::User,
                                            protocol::prompts::observation_message(result),
                                            std::nullopt});

            ++state.step_count;
            if (state.step_count >= state.max_steps) {
                const std::string note =
                    protocol::prompts::step_limit_message(state.max_steps);
                LOG_WARN("StepOrchestrator: reached maximum loop limit of " +
                         std::to_string(state.max_steps));
                emit(TextEvent{note, true});
                if (observer.on_message) {
                    observer.on_message(round.id, note, {});
                }
                outcome.final_content = note;
                return finish(outcome, state, OutcomeReason::StepLimit);
            }
            continue;
        }

        LOG_WARN("StepOrchestrator: round " + round.id +
                 " had neither <py-script> nor <finalResponse>; reminding the model");
        outcome.conversation.push_back({Role::Assistant, protocol::prompts::reminder_message(),
                                        std::nullopt});
        ++consecutive_reminders;
        if (request.max_reminders > 0 && consecutive_reminders >= request.max_reminders) {
            const std::string note =
                protocol::prompts::reminder_limit_message(request.max_reminders);
            emit(TextEvent{note, true});
            if (observer.on_message) {
                observer.on_message(round.id, note, {});
            }
            outcome.final_content = note;
            return finish(outcome, state, OutcomeReason::ReminderLimit);
        }
    }
}

}  // namespace codeloop::runtime
