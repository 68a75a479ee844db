#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/loop_errors.hpp"
#include "tools/code_executor.hpp"

namespace codeloop::tools {

struct ExecutorSettings {
    std::string interpreter = "python3";
    std::string script_suffix = ".py";
    std::filesystem::path working_directory = std::filesystem::current_path();
    std::filesystem::path scratch_subdir = ".codeloop";
    std::uint32_t timeout_ms = 30000;
    std::size_t max_output_bytes = 64 * 1024;
};

struct ScriptRun {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs each script as `<interpreter> <scratch file>` in a child process
// rooted at the working directory.
class InterpreterExecutor : public CodeExecutor {
public:
    explicit InterpreterExecutor(ExecutorSettings settings = {});

    std::string execute_code(
        const std::string& call_id, const std::string& source,
        const core::cancellation::CancelToken& cancel_token) override;

    core::errors::Result<ScriptRun> run_script(
        const std::string& call_id, const std::string& source,
        const core::cancellation::CancelToken& cancel_token) const;

    static std::string format_result(const ScriptRun& run, std::uint32_t timeout_ms);

private:
    ExecutorSettings settings_;
};

}  // namespace codeloop::tools
