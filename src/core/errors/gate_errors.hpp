#pragma once
#include <string>
#include <variant>

namespace bashgate::core::errors {

    // Where a failure came from. Errors raised while reading a hook request
    // or a command become a block verdict; CLI and policy file errors end
    // the process with a non-zero status.
    enum class ErrorCategory {
        Input,      // bad CLI flag or malformed hook request
        Parse,      // command text the tokenizer refuses
        Policy,
        Config,     // policy file has the wrong shape
        Internal
    };

    // code is a stable snake_case identifier, hint is shown after the message.
    struct GateError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // Returned by the parsing and config layers instead of throwing.
    template <typename T>
    using Result = std::variant<T, GateError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GateError>(result);
    }

    template <typename T>
    const GateError& get_error(const Result<T>& result) {
        return std::get<GateError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Parse:    return "parse";
            case ErrorCategory::Policy:   return "policy";
            case ErrorCategory::Config:   return "config";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace bashgate::core::errors
