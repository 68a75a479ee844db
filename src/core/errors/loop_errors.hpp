#pragma once
#include <string>
#include <variant>

namespace codeloop::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,      // E.g., User provided an invalid CLI flag or a zero step budget
        Config,     // E.g., Settings file is missing or not valid JSON
        Transport,  // E.g., Completion endpoint refused the connection mid-stream
        Execution,  // E.g., The interpreter could not be spawned at all
        Internal    // E.g., C++ logic bug
    };

    // The standardized error payload
    struct LoopError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";              // Helpful tips for the user
    };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result holds either a successful value of type T, OR a LoopError.
    template <typename T>
    using Result = std::variant<T, LoopError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<LoopError>(result);
    }

    template <typename T>
    const LoopError& get_error(const Result<T>& result) {
        return std::get<LoopError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Config:    return "config";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace codeloop::core::errors
