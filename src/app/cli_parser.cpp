#include "cli_parser.hpp"
#include <charconv>
#include <cstdlib>
#include <system_error>
#include <utility>
#include <vector>

namespace codeloop::app::cli {

    using namespace codeloop::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> task;
        std::optional<std::string> config_file;
        std::optional<std::string> preset;
        std::optional<std::string> model;
        std::optional<std::string> base_url;
        std::optional<std::string> temperature;
        std::optional<std::string> max_steps;
        std::optional<std::string> cwd;
        std::optional<std::string> interpreter;
        std::optional<std::string> timeout_ms;
        bool verbose = false;
    };

    namespace {

        // Exception-free integer parsing
        Result<uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                       uint32_t min_value, uint32_t max_value) {
            uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return LoopError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < min_value || value > max_value) {
                return LoopError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                 "Must be between " + std::to_string(min_value) + " and " + std::to_string(max_value) + "."};
            }
            return value;
        }

    } // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return LoopError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: codeloop_cli run --task \"...\""};
        }

        std::string command = argv[1];
        if (command != "run") {
            return LoopError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        const std::vector<std::pair<std::string, std::optional<std::string>*>> valued_flags = {
            {"--task", &raw.task},
            {"--config", &raw.config_file},
            {"--preset", &raw.preset},
            {"--model", &raw.model},
            {"--base-url", &raw.base_url},
            {"--temperature", &raw.temperature},
            {"--max-steps", &raw.max_steps},
            {"--cwd", &raw.cwd},
            {"--interpreter", &raw.interpreter},
            {"--timeout-ms", &raw.timeout_ms},
        };

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }

            bool matched = false;
            for (const auto& [flag, slot] : valued_flags) {
                if (args[i] != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return LoopError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                *slot = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return LoopError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions opts;
        opts.verbose = raw.verbose;

        if (!raw.task.has_value() || raw.task->find_first_not_of(" \t\r\n") == std::string::npos) {
            return LoopError{ErrorCategory::Input, "Must provide a non-empty --task", "missing_required_flag"};
        }
        opts.task = raw.task.value();

        if (raw.config_file) opts.config_file = std::filesystem::path(raw.config_file.value());
        if (raw.preset) opts.preset = raw.preset;
        if (raw.model) opts.model = raw.model;
        if (raw.base_url) opts.base_url = raw.base_url;
        if (raw.interpreter) opts.interpreter = raw.interpreter;

        if (raw.temperature) {
            const std::string& text = raw.temperature.value();
            char* parse_end = nullptr;
            const double temperature = std::strtod(text.c_str(), &parse_end);
            if (text.empty() || parse_end != text.c_str() + text.size()) {
                return LoopError{ErrorCategory::Input, "Invalid number for --temperature", "invalid_number"};
            }
            if (temperature < 0.0 || temperature > 2.0) {
                return LoopError{ErrorCategory::Input, "--temperature out of bounds", "bounds_error", "Must be between 0 and 2."};
            }
            opts.temperature = temperature;
        }

        if (raw.max_steps) {
            auto steps = parse_bounded("--max-steps", raw.max_steps.value(), 1, 1000);
            if (is_error(steps)) return get_error(steps);
            opts.max_steps = get_value(steps);
        }

        if (raw.timeout_ms) {
            auto timeout = parse_bounded("--timeout-ms", raw.timeout_ms.value(), 1, 3600000);
            if (is_error(timeout)) return get_error(timeout);
            opts.timeout_ms = get_value(timeout);
        }

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return LoopError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return LoopError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            opts.working_directory = std::move(canonical_path);
        }

        return opts;
    }

    void apply_overrides(codeloop::core::config::AgentSettings& settings, const CliOptions& options) {
        if (options.model) settings.model = *options.model;
        if (options.base_url) settings.base_url = *options.base_url;
        if (options.temperature) settings.temperature = *options.temperature;
        if (options.max_steps) settings.max_steps = *options.max_steps;
        if (options.interpreter) settings.interpreter = *options.interpreter;
        if (options.timeout_ms) settings.exec_timeout_ms = *options.timeout_ms;
    }

} // namespace codeloop::app::cli
