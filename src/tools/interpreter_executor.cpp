#include "tools/interpreter_executor.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"

namespace codeloop::tools {

using core::errors::ErrorCategory;
using core::errors::LoopError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

// Drops a multi-byte sequence left incomplete at the end of `text`.
void trim_partial_utf8_tail(std::string& text) {
    std::size_t lead = text.size();
    std::size_t continuation = 0;
    while (lead > 0 && continuation < 3 &&
           (static_cast<unsigned char>(text[lead - 1]) & 0xC0) == 0x80) {
        --lead;
        ++continuation;
    }
    if (lead == 0) {
        return;
    }
    --lead;
    const auto byte = static_cast<unsigned char>(text[lead]);
    std::size_t expected = 1;
    if ((byte & 0xE0) == 0xC0) {
        expected = 2;
    } else if ((byte & 0xF0) == 0xE0) {
        expected = 3;
    } else if ((byte & 0xF8) == 0xF0) {
        expected = 4;
    }
    if (text.size() - lead < expected) {
        text.erase(lead);
    }
}

struct PipeCapture {
    bool open = true;
    bool full = false;  // limit reached; later bytes are read and dropped
};

void drain_pipe(const int fd, PipeCapture& capture, std::string& out,
                const std::size_t limit) {
    if (!capture.open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            // Keep reading past the limit so the child never blocks on a full pipe.
            if (!capture.full) {
                out.append(buffer, std::min(static_cast<std::size_t>(n), limit - out.size()));
                if (out.size() >= limit) {
                    capture.full = true;
                    trim_partial_utf8_tail(out);
                }
            }
            continue;
        }
        if (n == 0) {
            capture.open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        capture.open = false;
        static_cast<void>(close(fd));
        return;
    }
}

std::string sanitize_for_filename(const std::string& value) {
    std::string safe;
    safe.reserve(value.size());
    for (const char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_') {
            safe.push_back(c);
        }
    }
    return safe.empty() ? "cell" : safe;
}

core::errors::Result<ScriptRun> run_process(
    const std::string& interpreter, const std::filesystem::path& script,
    const std::filesystem::path& cwd, const std::uint32_t timeout_ms,
    const std::size_t max_output_bytes,
    const core::cancellation::CancelToken& cancel_token) {
    if (core::cancellation::is_cancelled(cancel_token)) {
        ScriptRun run;
        run.cancelled = true;
        return run;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0) {
        return LoopError{ErrorCategory::Execution, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }
    if (pipe(stderr_pipe) != 0) {
        close_pipe(stdout_pipe);
        return LoopError{ErrorCategory::Execution, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    const std::string script_arg = script.string();
    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return LoopError{ErrorCategory::Execution, "Failed to fork process.",
                         "fork_failed"};
    }

    if (pid == 0) {
        // Own process group, so a kill also reaches anything the script spawned.
        static_cast<void>(setpgid(0, 0));
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        execlp(interpreter.c_str(), interpreter.c_str(), script_arg.c_str(),
               static_cast<char*>(nullptr));
        const std::string message = "Failed to start interpreter: " + interpreter + "\n";
        static_cast<void>(write(STDERR_FILENO, message.data(), message.size()));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ScriptRun run;
    PipeCapture stdout_capture;
    PipeCapture stderr_capture;
    bool child_exited = false;
    int status = 0;

    while (stdout_capture.open || stderr_capture.open || !child_exited) {
        if (!child_exited && !run.cancelled &&
            core::cancellation::is_cancelled(cancel_token)) {
            run.cancelled = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!run.timed_out && timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(timeout_ms) && !child_exited) {
            run.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_capture.open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_capture.open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_capture, run.stdout_text, max_output_bytes);
        drain_pipe(stderr_pipe[0], stderr_capture, run.stderr_text, max_output_bytes);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (WIFEXITED(status)) {
        run.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        run.exit_code = 128 + WTERMSIG(status);
    }

    run.duration_ms = std::chrono::duration<double, std::milli>(
                          std::chrono::steady_clock::now() - started)
                          .count();
    return run;
}

}  // namespace

InterpreterExecutor::InterpreterExecutor(ExecutorSettings settings)
    : settings_(std::move(settings)) {}

core::errors::Result<ScriptRun> InterpreterExecutor::run_script(
    const std::string& call_id, const std::string& source,
    const core::cancellation::CancelToken& cancel_token) const {
    if (settings_.interpreter.empty()) {
        return LoopError{ErrorCategory::Input, "Interpreter cannot be empty.",
                         "empty_interpreter"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(settings_.working_directory, ec) || ec) {
        return LoopError{ErrorCategory::Input,
                         "Working directory is not a directory: " +
                             settings_.working_directory.string(),
                         "invalid_working_directory"};
    }

    const auto scratch_dir = settings_.working_directory / settings_.scratch_subdir;
    std::filesystem::create_directories(scratch_dir, ec);
    if (ec) {
        return LoopError{ErrorCategory::Execution,
                         "Failed to create scratch directory: " + scratch_dir.string(),
                         "scratch_dir_failed"};
    }

    // Absolute, because the child changes directory before exec.
    const auto script_path = std::filesystem::absolute(
        scratch_dir / ("cell_" + sanitize_for_filename(call_id) + settings_.script_suffix), ec);
    if (ec) {
        return LoopError{ErrorCategory::Execution,
                         "Failed to resolve script path in: " + scratch_dir.string(),
                         "script_path_failed"};
    }
    {
        std::ofstream out(script_path, std::ios::trunc);
        if (!out.is_open()) {
            return LoopError{ErrorCategory::Execution,
                             "Failed to open script file: " + script_path.string(),
                             "script_open_failed"};
        }
        out << source << "\n";
        if (!out.good()) {
            return LoopError{ErrorCategory::Execution,
                             "Failed to write script file: " + script_path.string(),
                             "script_write_failed"};
        }
    }

    auto run = run_process(settings_.interpreter, script_path,
                           settings_.working_directory, settings_.timeout_ms,
                           settings_.max_output_bytes, cancel_token);

    std::filesystem::remove(script_path, ec);
    return run;
}

std::string InterpreterExecutor::format_result(const ScriptRun& run,
                                               const std::uint32_t timeout_ms) {
    std::string text = run.stdout_text;
    if (!run.stderr_text.empty()) {
        if (!text.empty() && text.back() != '\n') {
            text += "\n";
        }
        text += run.stderr_text;
    }

    std::string status;
    if (run.cancelled) {
        status = "Execution cancelled.";
    } else if (run.timed_out) {
        status = "Execution timed out after " + std::to_string(timeout_ms) + " ms.";
    } else if (run.exit_code != 0) {
        status = "Process exited with code " + std::to_string(run.exit_code) + ".";
    }

    if (!status.empty()) {
        if (!text.empty() && text.back() != '\n') {
            text += "\n";
        }
        text += status;
    }
    if (text.empty()) {
        return "(no output)";
    }
    // Scripts may print arbitrary bytes; results travel on as JSON strings.
    return core::text::sanitize_utf8(text);
}

std::string InterpreterExecutor::execute_code(
    const std::string& call_id, const std::string& source,
    const core::cancellation::CancelToken& cancel_token) {
    LOG_DEBUG("InterpreterExecutor: running cell " + call_id + " with " +
              settings_.interpreter);
    auto run = run_script(call_id, source, cancel_token);
    if (core::errors::is_error(run)) {
        const auto& err = core::errors::get_error(run);
        LOG_WARN("InterpreterExecutor: [" + err.code + "] " + err.message);
        return "Fatal error: " + err.message;
    }

    const auto& script_run = core::errors::get_value(run);
    LOG_DEBUG("InterpreterExecutor: cell " + call_id + " exited with " +
              std::to_string(script_run.exit_code) + " after " +
              std::to_string(static_cast<long>(script_run.duration_ms)) + " ms");
    return format_result(script_run, settings_.timeout_ms);
}

}  // namespace codeloop::tools
