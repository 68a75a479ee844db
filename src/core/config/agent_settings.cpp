#include "core/config/agent_settings.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <utility>
#include "core/logging/logger.hpp"

namespace codeloop::core::config {

using errors::ErrorCategory;
using errors::LoopError;

namespace {

constexpr double kMaxTemperature = 2.0;

// Counts must be whole numbers in [0, UINT32_MAX]; get<uint32_t>() alone
// would wrap -1 and truncate 2.5.
std::optional<LoopError> read_count(const nlohmann::json& layer, const char* key,
                                    std::uint32_t& target) {
    const auto& value = layer.at(key);
    std::uint64_t count = 0;
    if (value.is_number_unsigned()) {
        count = value.get<std::uint64_t>();
    } else if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        count = static_cast<std::uint64_t>(value.get<std::int64_t>());
    } else {
        return LoopError{ErrorCategory::Config,
                         std::string("Invalid settings value: ") + key +
                             " must be a non-negative integer, got " + value.dump(),
                         "invalid_settings"};
    }
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return LoopError{ErrorCategory::Config,
                         std::string("Invalid settings value: ") + key + " is too large (" +
                             std::to_string(count) + ")",
                         "invalid_settings"};
    }
    target = static_cast<std::uint32_t>(count);
    return std::nullopt;
}

// Unknown keys are ignored so one file can carry settings for other tools.
std::optional<LoopError> apply_layer(AgentSettings& settings, const nlohmann::json& layer) {
    if (layer.contains("base_url")) {
        settings.base_url = layer.at("base_url").get<std::string>();
    }
    if (layer.contains("api_key")) {
        settings.api_key = layer.at("api_key").get<std::string>();
    }
    if (layer.contains("model")) {
        settings.model = layer.at("model").get<std::string>();
    }
    if (layer.contains("temperature")) {
        settings.temperature = layer.at("temperature").get<double>();
    }
    if (layer.contains("instructions")) {
        settings.instructions = layer.at("instructions").get<std::string>();
    }
    if (layer.contains("interpreter")) {
        settings.interpreter = layer.at("interpreter").get<std::string>();
    }
    if (layer.contains("max_steps")) {
        if (auto err = read_count(layer, "max_steps", settings.max_steps)) {
            return err;
        }
    }
    if (layer.contains("max_reminders")) {
        if (auto err = read_count(layer, "max_reminders", settings.max_reminders)) {
            return err;
        }
    }
    if (layer.contains("exec_timeout_ms")) {
        if (auto err = read_count(layer, "exec_timeout_ms", settings.exec_timeout_ms)) {
            return err;
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

errors::Result<AgentSettings> settings_from_json(const nlohmann::json& document,
                                         const std::optional<std::string>& preset_name) {
    if (!document.is_object()) {
        return LoopError{ErrorCategory::Config, "Settings document must be a JSON object.",
                         "invalid_settings"};
    }

    AgentSettings settings;
    try {
        if (auto err = apply_layer(settings, document)) {
            return *err;
        }

        if (preset_name) {
            const auto presets = document.find("presets");
            if (presets == document.end() || !presets->is_array()) {
                return LoopError{ErrorCategory::Config,
                                 "Preset requested but settings define no presets: " +
                                     *preset_name,
                                 "preset_not_found"};
            }
            bool found = false;
            for (const auto& preset : *presets) {
                if (preset.is_object() && preset.value("name", std::string()) == *preset_name) {
                    if (auto err = apply_layer(settings, preset)) {
                        return *err;
                    }
                    found = true;
                    break;
                }
            }
            if (!found) {
                return LoopError{ErrorCategory::Config, "Unknown preset: " + *preset_name,
                                 "preset_not_found"};
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return LoopError{ErrorCategory::Config,
                         std::string("Invalid settings value: ") + e.what(),
                         "invalid_settings"};
    }
    return settings;
}

errors::Result<AgentSettings> load_settings_file(const std::filesystem::path& path,
                                         const std::optional<std::string>& preset_name) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return LoopError{ErrorCategory::Config, "Failed to open settings file: " + path.string(),
                         "settings_not_found", "Pass an existing JSON file to --config."};
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& e) {
        return LoopError{ErrorCategory::Config,
                         "Settings file is not valid JSON: " + path.string() + " (" +
                             e.what() + ")",
                         "invalid_settings_json"};
    }

    LOG_DEBUG("Settings: loaded " + path.string());
    return settings_from_json(document, preset_name);
}

void apply_env_overrides(AgentSettings& settings, const EnvLookup& lookup) {
    if (auto base_url = lookup("CODELOOP_BASE_URL")) {
        settings.base_url = std::move(*base_url);
    }
    if (auto api_key = lookup("CODELOOP_API_KEY")) {
        settings.api_key = std::move(*api_key);
    } else if (auto openai_key = lookup("OPENAI_API_KEY")) {
        settings.api_key = std::move(*openai_key);
    }
    if (auto model = lookup("CODELOOP_MODEL")) {
        settings.model = std::move(*model);
    }
}

errors::Result<AgentSettings> validate_settings(AgentSettings settings) {
    if (settings.base_url.empty()) {
        return LoopError{ErrorCategory::Config, "base_url cannot be empty.", "invalid_base_url"};
    }
    if (settings.model.empty()) {
        return LoopError{ErrorCategory::Config, "model cannot be empty.", "invalid_model"};
    }
    if (settings.temperature < 0.0 || settings.temperature > kMaxTemperature) {
        return LoopError{ErrorCategory::Config, "temperature out of bounds",
                         "invalid_temperature", "Must be between 0 and 2."};
    }
    if (settings.max_steps == 0) {
        return LoopError{ErrorCategory::Config, "max_steps must be greater than zero.",
                         "invalid_max_steps"};
    }
    if (settings.interpreter.empty()) {
        return LoopError{ErrorCategory::Config, "interpreter cannot be empty.",
                         "invalid_interpreter"};
    }
    return settings;
}

}  // namespace codeloop::core::config
