#pragma once
#include <optional>
#include <string>

namespace codeloop::protocol {

    enum class Role {
        User,
        Assistant,
        System,
        Tool
    };

    // One entry of the model's context. The orchestrator only ever appends.
    struct ConversationMessage {
        Role role;
        std::string content;

        // Set only on Role::Tool replies.
        std::optional<std::string> tool_call_id;
    };

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::User:
                return "user";
            case Role::Assistant:
                return "assistant";
            case Role::System:
                return "system";
            case Role::Tool:
                return "tool";
            default:
                return "unknown";
        }
    }

} // namespace codeloop::protocol
