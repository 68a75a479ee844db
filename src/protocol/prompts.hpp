#pragma once
#include <cstdint>
#include <string>

namespace codeloop::protocol::prompts {

// Default role text used when the host supplies no instructions.
extern const char* const kDefaultInstructions;

// Instructions followed by the tag grammar the parser understands.
std::string build_system_prompt(const std::string& instructions);

// User turn that feeds a sandbox result back to the model.
std::string observation_message(const std::string& result);

// Assistant turn appended when a round carries neither an action nor a final tag.
std::string reminder_message();

std::string step_limit_message(uint32_t max_steps);

std::string reminder_limit_message(uint32_t max_reminders);

}  // namespace codeloop::protocol::prompts
