#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/loop_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/loop_request.hpp"
#include "providers/completion_provider.hpp"
#include "runtime/step_orchestrator.hpp"
#include "tools/code_executor.hpp"

namespace {

using codeloop::core::cancellation::CancelToken;
using codeloop::core::cancellation::make_cancel_token;
using codeloop::core::cancellation::request_cancel;
using codeloop::core::errors::ErrorCategory;
using codeloop::core::errors::get_error;
using codeloop::core::errors::get_value;
using codeloop::core::errors::is_error;
using codeloop::core::errors::LoopError;
using codeloop::core::errors::Result;
using codeloop::protocol::FunctionCallEvent;
using codeloop::protocol::FunctionCallOutputEvent;
using codeloop::protocol::LoopEvent;
using codeloop::protocol::LoopRequest;
using codeloop::protocol::NewCompletionEvent;
using codeloop::protocol::OutcomeReason;
using codeloop::protocol::Role;
using codeloop::protocol::TextEvent;
using codeloop::providers::CompletionProvider;
using codeloop::providers::CompletionRequest;
using codeloop::providers::FragmentSink;
using codeloop::providers::StreamStatus;
using codeloop::runtime::LoopObserver;
using codeloop::runtime::StepOrchestrator;
using codeloop::tools::CodeExecutor;

struct ScriptedRound {
    std::vector<std::string> fragments;
    std::optional<LoopError> error;
};

// Plays one scripted round per stream() call; runs past the script answer with a final.
class ScriptedProvider : public CompletionProvider {
public:
    explicit ScriptedProvider(std::vector<ScriptedRound> rounds) : rounds_(std::move(rounds)) {}

    Result<StreamStatus> stream(const CompletionRequest& request, const FragmentSink& on_fragment,
                                const CancelToken&) override {
        requests.push_back(request);
        ScriptedRound round;
        if (next_ < rounds_.size()) {
            round = rounds_[next_++];
        } else {
            round.fragments = {"<finalResponse>out of script</finalResponse>"};
        }
        if (round.error) {
            return *round.error;
        }
        for (const auto& fragment : round.fragments) {
            if (!on_fragment(fragment)) {
                return StreamStatus::Stopped;
            }
        }
        return StreamStatus::Completed;
    }

    std::vector<CompletionRequest> requests;

private:
    std::vector<ScriptedRound> rounds_;
    std::size_t next_ = 0;
};

struct ExecutedCall {
    std::string call_id;
    std::string source;
};

class RecordingExecutor : public CodeExecutor {
public:
    std::string execute_code(const std::string& call_id, const std::string& source,
                             const CancelToken& cancel_token) override {
        calls.push_back({call_id, source});
        if (cancel_during_run) {
            request_cancel(cancel_token);
        }
        return output;
    }

    std::vector<ExecutedCall> calls;
    std::string output = "2\n";
    bool cancel_during_run = false;
};

struct Collected {
    std::vector<LoopEvent> events;

    template <typename T>
    std::vector<T> of() const {
        std::vector<T> matches;
        for (const auto& event : events) {
            if (const auto* typed = std::get_if<T>(&event)) {
                matches.push_back(*typed);
            }
        }
        return matches;
    }
};

LoopRequest make_request(uint32_t max_steps = 3) {
    LoopRequest request;
    request.history.push_back({Role::User, "What is 1+1?", std::nullopt});
    request.max_steps = max_steps;
    return request;
}

const char* const kActionRound =
    "<thoughts>calc</thoughts><py-script id=\"s1\">print(1+1)</py-script>";

TEST(StepOrchestratorTest, FinalResponseEndsInOneRound) {
    ScriptedProvider provider({{{"<thoughts>easy</thoughts>", "<finalResponse commit=\"a,b\">",
                                 "Two</finalResponse>"}, std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    Collected collected;
    std::vector<std::string> messages;
    LoopObserver observer;
    observer.on_message = [&](const std::string&, const std::string& text,
                              const std::vector<std::string>& commit_ids) {
        messages.push_back(text);
        EXPECT_EQ(commit_ids, (std::vector<std::string>{"a", "b"}));
    };

    auto result = orchestrator.run(
        make_request(), [&](const LoopEvent& e) { collected.events.push_back(e); }, nullptr,
        observer);
    ASSERT_FALSE(is_error(result));
    const auto& outcome = get_value(result);
    EXPECT_EQ(outcome.reason, OutcomeReason::Finished);
    EXPECT_EQ(outcome.final_content, "Two");
    EXPECT_EQ(outcome.steps_taken, 0u);
    EXPECT_TRUE(executor.calls.empty());
    EXPECT_EQ(messages, (std::vector<std::string>{"Two"}));

    ASSERT_FALSE(collected.events.empty());
    EXPECT_TRUE(std::holds_alternative<NewCompletionEvent>(collected.events.front()));
    const auto texts = collected.of<TextEvent>();
    ASSERT_EQ(texts.size(), 4u);
    EXPECT_EQ(texts[1].content, "<thoughts>easy</thoughts><finalResponse commit=\"a,b\">");
    EXPECT_FALSE(texts[2].terminal);
    EXPECT_TRUE(texts.back().terminal);
    EXPECT_EQ(texts.back().content, "Two");
}

TEST(StepOrchestratorTest, ActionRunsThenFeedsObservationBack) {
    ScriptedProvider provider({{{kActionRound}, std::nullopt},
                               {{"<finalResponse>It is 2.</finalResponse>"}, std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    Collected collected;
    auto result = orchestrator.run(make_request(),
                                   [&](const LoopEvent& e) { collected.events.push_back(e); });
    ASSERT_FALSE(is_error(result));
    const auto& outcome = get_value(result);
    EXPECT_EQ(outcome.reason, OutcomeReason::Finished);
    EXPECT_EQ(outcome.steps_taken, 1u);

    const auto rounds = collected.of<NewCompletionEvent>();
    ASSERT_EQ(rounds.size(), 2u);
    EXPECT_NE(rounds[0].completion_id, rounds[1].completion_id);

    const auto calls = collected.of<FunctionCallEvent>();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].name, "runCode");
    EXPECT_EQ(calls[0].code, "print(1+1)");
    EXPECT_EQ(calls[0].call_id, rounds[0].completion_id);

    const auto outputs = collected.of<FunctionCallOutputEvent>();
    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_EQ(outputs[0].call_id, calls[0].call_id);
    EXPECT_EQ(outputs[0].content, "2\n");

    ASSERT_EQ(executor.calls.size(), 1u);
    EXPECT_EQ(executor.calls[0].call_id, rounds[0].completion_id);
    EXPECT_EQ(executor.calls[0].source, "print(1+1)");

    // Order: new_completion, text, function_call, function_call_output, new_completion
    ASSERT_GE(collected.events.size(), 5u);
    EXPECT_TRUE(std::holds_alternative<TextEvent>(collected.events[1]));
    EXPECT_TRUE(std::holds_alternative<FunctionCallEvent>(collected.events[2]));
    EXPECT_TRUE(std::holds_alternative<FunctionCallOutputEvent>(collected.events[3]));
    EXPECT_TRUE(std::holds_alternative<NewCompletionEvent>(collected.events[4]));

    ASSERT_EQ(provider.requests.size(), 2u);
    const auto& second = provider.requests[1].messages;
    ASSERT_EQ(second.size(), 4u);
    EXPECT_EQ(second[0].role, Role::System);
    EXPECT_EQ(second[2].role, Role::Assistant);
    EXPECT_EQ(second[2].content,
              "<thoughts>calc</thoughts>\n<py-script id=\"s1\">print(1+1)</py-script>");
    EXPECT_EQ(second[3].role, Role::User);
    EXPECT_NE(second[3].content.find("<observation>"), std::string::npos);
    EXPECT_NE(second[3].content.find("2\n"), std::string::npos);
}

TEST(StepOrchestratorTest, StepLimitStopsWithNote) {
    ScriptedProvider provider({{{kActionRound}, std::nullopt}, {{kActionRound}, std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    Collected collected;
    std::vector<std::string> commits_seen;
    LoopObserver observer;
    observer.on_message = [&](const std::string&, const std::string& text,
                              const std::vector<std::string>& commit_ids) {
        commits_seen = commit_ids;
        EXPECT_NE(text.find("Reached maximum number of tool calls (1)"), std::string::npos);
    };

    auto result = orchestrator.run(
        make_request(1), [&](const LoopEvent& e) { collected.events.push_back(e); }, nullptr,
        observer);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).reason, OutcomeReason::StepLimit);
    EXPECT_EQ(get_value(result).steps_taken, 1u);
    EXPECT_EQ(executor.calls.size(), 1u);
    EXPECT_EQ(provider.requests.size(), 1u);
    EXPECT_TRUE(commits_seen.empty());

    const auto texts = collected.of<TextEvent>();
    ASSERT_FALSE(texts.empty());
    EXPECT_TRUE(texts.back().terminal);
    EXPECT_EQ(texts.back().content,
              "Note: Reached maximum number of tool calls (1). Some actions may not have "
              "completed. Please try breaking your request into smaller steps.");
    EXPECT_TRUE(std::holds_alternative<TextEvent>(collected.events.back()));
}

TEST(StepOrchestratorTest, TaglessRoundAppendsReminderAndRetries) {
    ScriptedProvider provider({{{"I think the answer is 2."}, std::nullopt},
                               {{"<finalResponse>2</finalResponse>"}, std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    Collected collected;
    auto result = orchestrator.run(make_request(),
                                   [&](const LoopEvent& e) { collected.events.push_back(e); });
    ASSERT_FALSE(is_error(result));
    const auto& outcome = get_value(result);
    EXPECT_EQ(outcome.reason, OutcomeReason::Finished);
    EXPECT_EQ(outcome.steps_taken, 0u);
    EXPECT_TRUE(collected.of<FunctionCallEvent>().empty());
    EXPECT_EQ(collected.of<NewCompletionEvent>().size(), 2u);

    ASSERT_EQ(outcome.conversation.size(), 2u);
    EXPECT_EQ(outcome.conversation[1].role, Role::Assistant);
    EXPECT_NE(outcome.conversation[1].content.find("<py-script>"), std::string::npos);
}

TEST(StepOrchestratorTest, ReminderLimitEndsLoop) {
    ScriptedProvider provider({{{"no tags"}, std::nullopt}, {{"still none"}, std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    LoopRequest request = make_request();
    request.max_reminders = 2;
    auto result = orchestrator.run(request, [](const LoopEvent&) {});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).reason, OutcomeReason::ReminderLimit);
    EXPECT_EQ(provider.requests.size(), 2u);
}

TEST(StepOrchestratorTest, CancelledBeforeStartEmitsNothing) {
    ScriptedProvider provider({{{kActionRound}, std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    auto token = make_cancel_token();
    request_cancel(token);
    Collected collected;
    auto result = orchestrator.run(
        make_request(), [&](const LoopEvent& e) { collected.events.push_back(e); }, token);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).reason, OutcomeReason::Cancelled);
    EXPECT_TRUE(collected.events.empty());
    EXPECT_TRUE(provider.requests.empty());
}

TEST(StepOrchestratorTest, CancelDuringStreamingStopsEvents) {
    ScriptedProvider provider({{{"<thoughts>a", "b</thoughts>", "<finalResponse>x</finalResponse>"},
                                std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    auto token = make_cancel_token();
    LoopObserver observer;
    observer.on_streaming = [&](const std::string&, const std::string&) { request_cancel(token); };

    Collected collected;
    auto result = orchestrator.run(
        make_request(), [&](const LoopEvent& e) { collected.events.push_back(e); }, token,
        observer);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).reason, OutcomeReason::Cancelled);
    ASSERT_EQ(collected.events.size(), 2u);
    EXPECT_EQ(collected.of<TextEvent>()[0].content, "<thoughts>a");
}

TEST(StepOrchestratorTest, CancelDuringExecutionSuppressesOutput) {
    ScriptedProvider provider({{{kActionRound}, std::nullopt}});
    RecordingExecutor executor;
    executor.cancel_during_run = true;
    StepOrchestrator orchestrator(provider, executor);

    Collected collected;
    auto result = orchestrator.run(
        make_request(), [&](const LoopEvent& e) { collected.events.push_back(e); },
        make_cancel_token());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).reason, OutcomeReason::Cancelled);
    EXPECT_EQ(executor.calls.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<FunctionCallEvent>(collected.events.back()));
    EXPECT_TRUE(collected.of<FunctionCallOutputEvent>().empty());
}

TEST(StepOrchestratorTest, CancelBeforeExecutionSkipsSandbox) {
    ScriptedProvider provider({{{kActionRound}, std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    auto token = make_cancel_token();
    Collected collected;
    auto result = orchestrator.run(
        make_request(),
        [&](const LoopEvent& e) {
            collected.events.push_back(e);
            if (std::holds_alternative<FunctionCallEvent>(e)) {
                request_cancel(token);
            }
        },
        token);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).reason, OutcomeReason::Cancelled);
    EXPECT_EQ(get_value(result).steps_taken, 0u);
    EXPECT_TRUE(executor.calls.empty());
    ASSERT_FALSE(collected.events.empty());
    EXPECT_TRUE(std::holds_alternative<FunctionCallEvent>(collected.events.back()));
    EXPECT_TRUE(collected.of<FunctionCallOutputEvent>().empty());
}

TEST(StepOrchestratorTest, StepLimitAllowsExactlyMaxStepsActions) {
    ScriptedProvider provider({{{kActionRound}, std::nullopt},
                               {{kActionRound}, std::nullopt},
                               {{kActionRound}, std::nullopt},
                               {{kActionRound}, std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    Collected collected;
    auto result = orchestrator.run(make_request(3),
                                   [&](const LoopEvent& e) { collected.events.push_back(e); });
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).reason, OutcomeReason::StepLimit);
    EXPECT_EQ(get_value(result).steps_taken, 3u);

    const auto rounds = collected.of<NewCompletionEvent>();
    const auto calls = collected.of<FunctionCallEvent>();
    const auto outputs = collected.of<FunctionCallOutputEvent>();
    EXPECT_EQ(rounds.size(), 3u);
    ASSERT_EQ(calls.size(), 3u);
    ASSERT_EQ(outputs.size(), 3u);
    for (std::size_t i = 0; i < calls.size(); ++i) {
        EXPECT_EQ(calls[i].call_id, rounds[i].completion_id);
        EXPECT_EQ(outputs[i].call_id, calls[i].call_id);
    }
    EXPECT_EQ(executor.calls.size(), 3u);
    EXPECT_EQ(provider.requests.size(), 3u);

    ASSERT_TRUE(std::holds_alternative<TextEvent>(collected.events.back()));
    const auto& note = std::get<TextEvent>(collected.events.back());
    EXPECT_TRUE(note.terminal);
    EXPECT_NE(note.content.find("Reached maximum number of tool calls (3)"), std::string::npos);
}

TEST(StepOrchestratorTest, AssistantTurnKeepsThoughtsAsWritten) {
    const std::string thoughts = "<thoughts>\n  first add\n\n  then print  \n</thoughts>";
    const std::string script = "<py-script id=\"s1\">print(1+1)</py-script>";
    ScriptedProvider provider({{{thoughts + "\n" + script}, std::nullopt},
                               {{"<finalResponse>2</finalResponse>"}, std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    auto result = orchestrator.run(make_request(), [](const LoopEvent&) {});
    ASSERT_FALSE(is_error(result));
    const auto& conversation = get_value(result).conversation;
    ASSERT_GE(conversation.size(), 2u);
    EXPECT_EQ(conversation[1].role, Role::Assistant);
    EXPECT_EQ(conversation[1].content, thoughts + "\n" + script);
}

TEST(StepOrchestratorTest, TransportErrorIsReturned) {
    ScriptedProvider provider(
        {{{}, LoopError{ErrorCategory::Transport, "connection refused", "transport_failed"}}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    auto result = orchestrator.run(make_request(), [](const LoopEvent&) {});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Transport);
    EXPECT_EQ(get_error(result).code, "transport_failed");
    EXPECT_EQ(provider.requests.size(), 1u);
}

TEST(StepOrchestratorTest, ZeroStepBudgetIsRejected) {
    ScriptedProvider provider(std::vector<ScriptedRound>{});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    auto result = orchestrator.run(make_request(0), [](const LoopEvent&) {});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_TRUE(provider.requests.empty());
}

TEST(StepOrchestratorTest, FinalWinsOverActionInSameRound) {
    ScriptedProvider provider(
        {{{"<py-script>print(3)</py-script><finalResponse>done</finalResponse>"}, std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    auto result = orchestrator.run(make_request(), [](const LoopEvent&) {});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).reason, OutcomeReason::Finished);
    EXPECT_EQ(get_value(result).final_content, "done");
    EXPECT_TRUE(executor.calls.empty());
}

TEST(StepOrchestratorTest, CallerHistoryIsNotMutated) {
    ScriptedProvider provider({{{kActionRound}, std::nullopt},
                               {{"<finalResponse>ok</finalResponse>"}, std::nullopt}});
    RecordingExecutor executor;
    StepOrchestrator orchestrator(provider, executor);

    const LoopRequest request = make_request();
    auto result = orchestrator.run(request, [](const LoopEvent&) {});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(request.history.size(), 1u);
    EXPECT_EQ(get_value(result).conversation.size(), 3u);
    EXPECT_EQ(provider.requests[0].messages.size(), 2u);
}

}  // namespace
