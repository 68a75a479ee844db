#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "app/cli_parser.hpp"
#include "core/config/agent_settings.hpp"
#include "core/errors/loop_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/loop_request.hpp"
#include "providers/openai_stream_provider.hpp"
#include "runtime/event_channel.hpp"
#include "runtime/step_orchestrator.hpp"
#include "session/session_manager.hpp"
#include "tools/interpreter_executor.hpp"

namespace {

namespace errors = codeloop::core::errors;

// Points into the active session's token; atomic_bool stores are lock-free
// and safe to perform from a signal handler.
std::atomic<std::atomic_bool*> g_interrupt_flag{nullptr};

extern "C" void handle_interrupt(int) {
    std::atomic_bool* flag = g_interrupt_flag.load();
    if (flag != nullptr) {
        flag->store(true);
    }
}

int exit_code_for(const errors::ErrorCategory category) {
    switch (category) {
        case errors::ErrorCategory::Input:
            return 2;
        case errors::ErrorCategory::Config:
            return 3;
        case errors::ErrorCategory::Transport:
            return 4;
        case errors::ErrorCategory::Execution:
            return 5;
        case errors::ErrorCategory::Internal:
        default:
            return 6;
    }
}

void report(const std::string& context, const errors::LoopError& err) {
    LOG_ERROR(context + " [" + errors::to_string(err.category) + "/" + err.code + "]: " +
              err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = codeloop::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        report("Input error", err);
        return exit_code_for(err.category);
    }
    const auto& opts = errors::get_value(parsed);
    if (opts.verbose) {
        codeloop::core::logging::Logger::get().set_min_level(
            codeloop::core::logging::LogLevel::DEBUG);
    } else if (auto level_name = codeloop::core::config::process_env("CODELOOP_LOG_LEVEL")) {
        const auto level = codeloop::core::logging::parse_log_level(*level_name);
        if (level) {
            codeloop::core::logging::Logger::get().set_min_level(*level);
        } else {
            LOG_WARN("Ignoring unknown CODELOOP_LOG_LEVEL: " + *level_name);
        }
    }

    // 2. Resolve settings: file (and preset), then environment, then flags
    codeloop::core::config::AgentSettings base_settings;
    if (opts.config_file) {
        auto loaded = codeloop::core::config::load_settings_file(*opts.config_file, opts.preset);
        if (errors::is_error(loaded)) {
            report("Configuration error", errors::get_error(loaded));
            return exit_code_for(errors::ErrorCategory::Config);
        }
        base_settings = errors::get_value(loaded);
    } else if (opts.preset) {
        report("Configuration error",
               errors::LoopError{errors::ErrorCategory::Config, "--preset requires --config.",
                                 "preset_without_config"});
        return exit_code_for(errors::ErrorCategory::Config);
    }
    codeloop::core::config::apply_env_overrides(base_settings);
    codeloop::app::cli::apply_overrides(base_settings, opts);

    auto validated = codeloop::core::config::validate_settings(base_settings);
    if (errors::is_error(validated)) {
        const auto& err = errors::get_error(validated);
        report("Configuration error", err);
        return exit_code_for(err.category);
    }
    const auto& settings = errors::get_value(validated);

    // 3. Register the session and its cancellation token
    codeloop::session::SessionManager sessions;
    auto started = sessions.start_session(opts.task);
    if (errors::is_error(started)) {
        const auto& err = errors::get_error(started);
        report("Failed to start session", err);
        return exit_code_for(err.category);
    }
    const std::string session_id = errors::get_value(started);
    codeloop::core::logging::Logger::get().set_session_id(session_id);
    LOG_INFO("Session started with model " + settings.model + " at " + settings.base_url);

    auto token_result = sessions.get_cancel_token(session_id);
    if (errors::is_error(token_result)) {
        const auto& err = errors::get_error(token_result);
        report("Failed to get cancellation token", err);
        return exit_code_for(err.category);
    }
    const auto cancel_token = errors::get_value(token_result);
    g_interrupt_flag.store(cancel_token.get());
    std::signal(SIGINT, handle_interrupt);

    // 4. Wire provider, executor and orchestrator
    codeloop::providers::ProviderSettings provider_settings;
    provider_settings.base_url = settings.base_url;
    provider_settings.api_key = settings.api_key;
    codeloop::providers::OpenAiStreamProvider provider(provider_settings);

    codeloop::tools::ExecutorSettings executor_settings;
    executor_settings.interpreter = settings.interpreter;
    executor_settings.timeout_ms = settings.exec_timeout_ms;
    executor_settings.working_directory = opts.working_directory;
    codeloop::tools::InterpreterExecutor executor(executor_settings);

    codeloop::runtime::StepOrchestrator orchestrator(provider, executor);

    codeloop::protocol::LoopRequest request;
    request.history.push_back({codeloop::protocol::Role::User, opts.task, std::nullopt});
    request.instructions = settings.instructions;
    request.model = settings.model;
    request.temperature = settings.temperature;
    request.max_steps = settings.max_steps;
    request.max_reminders = settings.max_reminders;

    codeloop::runtime::LoopObserver observer;
    observer.on_message = [](const std::string& round_id, const std::string&,
                             const std::vector<std::string>& commit_ids) {
        std::string ids;
        for (const auto& id : commit_ids) {
            ids += (ids.empty() ? "" : ",") + id;
        }
        LOG_INFO("Round " + round_id + " finished" +
                 (ids.empty() ? std::string() : " (commit " + ids + ")"));
    };

    // 5. Run the loop on a worker and stream events to stdout as JSON lines
    codeloop::runtime::EventChannel channel;
    std::optional<errors::Result<codeloop::protocol::LoopOutcome>> result;
    std::thread worker([&] {
        try {
            result = orchestrator.run(
                request,
                [&channel](const codeloop::protocol::LoopEvent& event) {
                    static_cast<void>(channel.push(event));
                },
                cancel_token, observer);
        } catch (const std::exception& e) {
            result = errors::LoopError{errors::ErrorCategory::Internal,
                                       std::string("Unexpected exception in loop: ") + e.what(),
                                       "unhandled_exception"};
        }
        channel.close();
    });

    while (auto event = channel.pop()) {
        std::cout << codeloop::protocol::to_wire_line(*event) << std::endl;
    }
    worker.join();
    std::signal(SIGINT, SIG_DFL);
    g_interrupt_flag.store(nullptr);

    // 6. Settle the session state and exit status
    if (!result.has_value()) {
        LOG_ERROR("Loop finished without a result.");
        return exit_code_for(errors::ErrorCategory::Internal);
    }
    if (errors::is_error(*result)) {
        const auto& err = errors::get_error(*result);
        report("Loop failed", err);
        auto failed = sessions.mark_failed(session_id, err.message);
        if (errors::is_error(failed)) {
            report("Failed to mark session as failed", errors::get_error(failed));
        }
        return exit_code_for(err.category);
    }

    const auto& outcome = errors::get_value(*result);
    LOG_INFO("Loop ended: " + codeloop::protocol::to_string(outcome.reason) + " after " +
             std::to_string(outcome.steps_taken) + " step(s)");

    if (outcome.reason == codeloop::protocol::OutcomeReason::Cancelled) {
        auto cancelled = sessions.mark_cancelled(session_id);
        if (errors::is_error(cancelled)) {
            report("Failed to mark session as cancelled", errors::get_error(cancelled));
        }
        return 130;
    }

    auto completed = sessions.mark_completed(session_id);
    if (errors::is_error(completed)) {
        report("Failed to mark session as completed", errors::get_error(completed));
        return exit_code_for(errors::ErrorCategory::Internal);
    }
    return outcome.reason == codeloop::protocol::OutcomeReason::Finished ? 0 : 1;
}
