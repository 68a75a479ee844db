#pragma once

#include <string>
#include "core/cancellation/cancel_token.hpp"

namespace codeloop::tools {

// The sandbox collaborator. Called at most once per action segment; whatever
// happens inside (success, traceback, timeout) comes back as plain text.
class CodeExecutor {
public:
    virtual ~CodeExecutor() = default;

    virtual std::string execute_code(
        const std::string& call_id, const std::string& source,
        const core::cancellation::CancelToken& cancel_token) = 0;
};

}  // namespace codeloop::tools
