#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace codeloop::protocol {

    // Name reported in function_call events for sandbox requests.
    inline constexpr const char* kRunCodeToolName = "runCode";

    // A <py-script> block handed to the sandbox.
    struct ActionSegment {
        std::string id;                     // always the round id
        std::string code;                   // trimmed script body
        std::string raw;                    // the whole tag exactly as the model wrote it
        std::optional<std::string> tag_id;  // the tag's own id="" attribute, informational only
    };

    // A <finalResponse> block that ends the loop.
    struct FinalSegment {
        std::string content;
        std::unordered_map<std::string, std::string> attributes;
        std::vector<std::string> commit_ids;
    };

} // namespace codeloop::protocol
