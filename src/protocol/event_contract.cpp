#include "protocol/event_contract.hpp"

namespace codeloop::protocol {

using nlohmann::json;

namespace {

struct TypeNameVisitor {
    std::string operator()(const NewCompletionEvent&) const { return "new_completion"; }
    std::string operator()(const TextEvent&) const { return "text"; }
    std::string operator()(const FunctionCallEvent&) const { return "function_call"; }
    std::string operator()(const FunctionCallOutputEvent&) const {
        return "function_call_output";
    }
};

struct JsonVisitor {
    json operator()(const NewCompletionEvent& event) const {
        json payload;
        payload["completion_id"] = event.completion_id;
        return payload;
    }

    json operator()(const TextEvent& event) const {
        json payload;
        payload["content"] = event.content;
        if (event.terminal) {
            payload["terminal"] = true;
        }
        return payload;
    }

    json operator()(const FunctionCallEvent& event) const {
        json payload;
        payload["name"] = event.name;
        payload["arguments"] = json{{"code", event.code}};
        payload["call_id"] = event.call_id;
        return payload;
    }

    json operator()(const FunctionCallOutputEvent& event) const {
        json payload;
        payload["content"] = event.content;
        payload["call_id"] = event.call_id;
        return payload;
    }
};

}  // namespace

std::string event_type(const LoopEvent& event) {
    return std::visit(TypeNameVisitor{}, event);
}

json to_json(const LoopEvent& event) {
    json payload = std::visit(JsonVisitor{}, event);
    payload["type"] = event_type(event);
    return payload;
}

std::string to_wire_line(const LoopEvent& event) {
    return to_json(event).dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace codeloop::protocol
