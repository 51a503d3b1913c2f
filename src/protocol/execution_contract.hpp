#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace shellgate::protocol {

enum class ExecutionMode {
    Autonomous,
    Review,
    Tutor
};

enum class ExecutionStatus {
    Completed,
    Denied,
    TimedOut,
    Error
};

struct ExecutionRequest {
    std::string id;
    std::string command;
    ExecutionMode mode = ExecutionMode::Autonomous;
    std::chrono::milliseconds timeout{30000};
};

struct ExecutionResult {
    std::string id;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    ExecutionStatus status = ExecutionStatus::Error;
};

inline std::string to_string(const ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Autonomous:
            return "autonomous";
        case ExecutionMode::Review:
            return "review";
        case ExecutionMode::Tutor:
            return "tutor";
        default:
            return "unknown";
    }
}

inline std::string to_string(const ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Completed:
            return "completed";
        case ExecutionStatus::Denied:
            return "denied";
        case ExecutionStatus::TimedOut:
            return "timed_out";
        case ExecutionStatus::Error:
            return "error";
        default:
            return "unknown";
    }
}

// Control-plane names (logonly/watch/dialog) collapse onto the three agent modes.
inline std::optional<ExecutionMode> parse_mode(const std::string& text) {
    if (text == "autonomous" || text == "dialog") {
        return ExecutionMode::Autonomous;
    }
    if (text == "review" || text == "logonly") {
        return ExecutionMode::Review;
    }
    if (text == "tutor" || text == "watch") {
        return ExecutionMode::Tutor;
    }
    return std::nullopt;
}

inline std::optional<ExecutionStatus> parse_status(const std::string& text) {
    if (text == "completed") {
        return ExecutionStatus::Completed;
    }
    if (text == "denied") {
        return ExecutionStatus::Denied;
    }
    if (text == "timed_out") {
        return ExecutionStatus::TimedOut;
    }
    if (text == "error") {
        return ExecutionStatus::Error;
    }
    return std::nullopt;
}

inline ExecutionResult make_result(const std::string& id,
                                   const ExecutionStatus status,
                                   const std::string& reason = "") {
    ExecutionResult result;
    result.id = id;
    result.status = status;
    result.stderr_text = reason;
    return result;
}

}  // namespace shellgate::protocol
