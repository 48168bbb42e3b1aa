#pragma once
#include <string>
#include <variant>

namespace toolgate::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,          // E.g., an unknown CLI flag or a malformed argument
        Configuration,  // E.g., a server config rejected at registration
        Startup,        // E.g., the process exited before the handshake
        Timeout,        // E.g., a single RPC call exceeded its budget
        Protocol,       // E.g., the server wrote a non-JSON line to stdout
        ToolExecution,  // E.g., the tool itself reported a failure
        Storage,        // E.g., the registry file could not be written
        Unavailable,    // E.g., the server is not running or its process died
        Internal        // E.g., pipe() or fork() failed
    };

    // The standardized error payload
    struct ToolgateError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a ToolgateError.
    template <typename T>
    using Result = std::variant<T, ToolgateError>;

    // Stand-in value type for operations that only succeed or fail.
    struct Done {};

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ToolgateError>(result);
    }

    template <typename T>
    const ToolgateError& get_error(const Result<T>& result) {
        return std::get<ToolgateError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:         return "input";
            case ErrorCategory::Configuration: return "configuration";
            case ErrorCategory::Startup:       return "startup";
            case ErrorCategory::Timeout:       return "timeout";
            case ErrorCategory::Protocol:      return "protocol";
            case ErrorCategory::ToolExecution: return "tool_execution";
            case ErrorCategory::Storage:       return "storage";
            case ErrorCategory::Unavailable:   return "unavailable";
            case ErrorCategory::Internal:      return "internal";
            default:                           return "unknown";
        }
    }

} // namespace toolgate::core::errors
