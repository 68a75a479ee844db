#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/config/agent_settings.hpp"
#include "core/errors/loop_errors.hpp"

namespace codeloop::app::cli {

    // Validated `run` invocation. Unset optionals leave the configured value alone.
    struct CliOptions {
        std::string task;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::string> preset;
        std::optional<std::string> model;
        std::optional<std::string> base_url;
        std::optional<double> temperature;
        std::optional<uint32_t> max_steps;
        std::filesystem::path working_directory = std::filesystem::current_path();
        std::optional<std::string> interpreter;
        std::optional<uint32_t> timeout_ms;
        bool verbose = false;
    };

    codeloop::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    // Flags take precedence over file and environment settings.
    void apply_overrides(codeloop::core::config::AgentSettings& settings, const CliOptions& options);
}
