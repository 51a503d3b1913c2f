#pragma once
#include <string>
#include <variant>
#include <utility>

namespace shellgate::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,      // E.g., malformed envelope, bad CLI flag, invalid config
        Spawn,      // E.g., the shell executable could not be started
        Transport,  // E.g., ConnectionRefused or ChannelClosed on the socket
        Policy,     // E.g., a configured pattern failed to compile
        Timeout,    // E.g., the shell never printed its first prompt
        Cancelled,  // E.g., the agent is shutting down
        Internal    // E.g., pipe/fork/ioctl failures
    };

    // The standardized error payload
    struct GateError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the operator
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a GateError.
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

    // Move-only payloads (sessions, channels) are taken out of the Result.
    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Spawn:
                return "spawn";
            case ErrorCategory::Transport:
                return "transport";
            case ErrorCategory::Policy:
                return "policy";
            case ErrorCategory::Timeout:
                return "timeout";
            case ErrorCategory::Cancelled:
                return "cancelled";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace shellgate::core::errors
