#pragma once
#include <string>
#include <utility>
#include <variant>

namespace sandrun::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,                // Malformed request, CLI flag or config value
        Policy,               // Snippet path escapes its workspace
        UnsupportedLanguage,  // Language is not in the runner registry
        RunnerUnavailable,    // Interpreter binary missing or not executable
        Resource,             // Workspace could not be allocated
        Internal              // Pipe/fork failure or logic bug
    };

    // The standardized error payload
    struct ExecError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Actionable tip for the caller
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR an ExecError.
    template <typename T>
    using Result = std::variant<T, ExecError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ExecError>(result);
    }

    template <typename T>
    const ExecError& get_error(const Result<T>& result) {
        return std::get<ExecError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Policy: return "policy";
            case ErrorCategory::UnsupportedLanguage: return "unsupported_language";
            case ErrorCategory::RunnerUnavailable: return "runner_unavailable";
            case ErrorCategory::Resource: return "resource";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace sandrun::core::errors
