#include "protocol/prompts.hpp"

namespace codeloop::protocol::prompts {

const char* const kDefaultInstructions =
    "You are a code assistant that solves tasks by writing and running Python "
    "scripts. Use scripts to inspect data, verify assumptions and compute "
    "results, then summarise what you found for the user.";

namespace {

const char* const kGrammar =
    "RESPONSE FORMAT\n"
    "Every reply starts with your reasoning inside <thoughts>...</thoughts>, "
    "followed by exactly ONE of:\n"
    "\n"
    "1. A script to run, when you need more information or must perform an action:\n"
    "<py-script id=\"short_id\">\n"
    "# valid multi-line Python\n"
    "</py-script>\n"
    "Stop after the closing tag. The script output comes back to you inside "
    "<observation>...</observation>.\n"
    "\n"
    "2. The final answer, when you have everything you need:\n"
    "<finalResponse commit=\"id1,id2\">\n"
    "Your answer to the user.\n"
    "</finalResponse>\n"
    "The optional commit attribute lists the ids of scripts whose results "
    "should be kept.\n"
    "\n"
    "Never put a script and a final answer in the same reply. Break complex "
    "tasks into several small scripts.";

}  // namespace

std::string build_system_prompt(const std::string& instructions) {
    const std::string role = instructions.empty() ? kDefaultInstructions : instructions;
    return role + "\n\n" + kGrammar;
}

std::string observation_message(const std::string& result) {
    return "<observation>\n" + result +
           "\n</observation>\n"
           "Continue with the next step: run another <py-script> or answer "
           "with <finalResponse>.";
}

std::string reminder_message() {
    return "I must reply with <thoughts>...</thoughts> followed by either a "
           "<py-script>...</py-script> block or a "
           "<finalResponse>...</finalResponse> block. Let me answer again "
           "using one of these tags.";
}

std::string step_limit_message(const uint32_t max_steps) {
    return "Note: Reached maximum number of tool calls (" +
           std::to_string(max_steps) +
           "). Some actions may not have completed. Please try breaking your "
           "request into smaller steps.";
}

std::string reminder_limit_message(const uint32_t max_reminders) {
    return "Note: The model replied " + std::to_string(max_reminders) +
           " times without a <py-script> or <finalResponse> block. Stopping "
           "here; please rephrase the request or try another model.";
}

}  // namespace codeloop::protocol::prompts
