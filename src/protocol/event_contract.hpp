#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace codeloop::protocol {

    // Always the first event of a round.
    struct NewCompletionEvent { std::string completion_id; };

    // Carries the whole buffer so far, not a delta. `terminal` marks the last
    // event of the invocation (final answer or a synthesized stop message).
    struct TextEvent {
        std::string content;
        bool terminal = false;
    };

    struct FunctionCallEvent {
        std::string name;
        std::string code;
        std::string call_id;
    };

    struct FunctionCallOutputEvent {
        std::string content;
        std::string call_id;
    };

    using LoopEvent = std::variant<
        NewCompletionEvent,
        TextEvent,
        FunctionCallEvent,
        FunctionCallOutputEvent
    >;

    std::string event_type(const LoopEvent& event);

    // Wire form, e.g. {"type":"function_call","name":"runCode",
    // "arguments":{"code":"..."},"call_id":"..."}
    nlohmann::json to_json(const LoopEvent& event);

    // to_json as one compact line. Invalid UTF-8 in any string becomes U+FFFD.
    std::string to_wire_line(const LoopEvent& event);

} // namespace codeloop::protocol
