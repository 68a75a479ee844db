#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/loop_errors.hpp"

namespace codeloop::core::config {

struct AgentSettings {
    std::string base_url = "http://localhost:11434/v1/";
    std::string api_key = "ollama";
    std::string model = "llama3.1:latest";
    double temperature = 0.7;
    std::string instructions;  // empty selects the built-in role text
    std::uint32_t max_steps = 10;
    std::uint32_t max_reminders = 0;  // 0 = unbounded
    std::string interpreter = "python3";
    std::uint32_t exec_timeout_ms = 30000;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads from the process environment.
std::optional<std::string> process_env(const std::string& name);

// Layers a settings document over the defaults:
//   { "model": ..., "presets": [ { "name": "fast", "model": ... } ] }
// When preset_name is set, that entry of "presets" is applied last.
errors::Result<AgentSettings> settings_from_json(const nlohmann::json& document,
                                         const std::optional<std::string>& preset_name);

errors::Result<AgentSettings> load_settings_file(const std::filesystem::path& path,
                                         const std::optional<std::string>& preset_name);

// CODELOOP_BASE_URL, CODELOOP_API_KEY (falling back to OPENAI_API_KEY), CODELOOP_MODEL.
void apply_env_overrides(AgentSettings& settings, const EnvLookup& lookup = process_env);

errors::Result<AgentSettings> validate_settings(AgentSettings settings);

}  // namespace codeloop::core::config
