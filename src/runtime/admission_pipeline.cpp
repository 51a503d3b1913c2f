#include "runtime/admission_pipeline.hpp"

#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace shellgate::runtime {

using core::errors::ErrorCategory;
using core::errors::GateError;
using policy::Verdict;
using protocol::ExecutionMode;
using protocol::ExecutionRequest;
using protocol::ExecutionResult;
using protocol::ExecutionStatus;
using protocol::make_result;
using terminal::MarkerWait;
using terminal::WaitStatus;

namespace {

constexpr auto kIdleRecheck = std::chrono::milliseconds(0);
constexpr auto kIdlePoll = std::chrono::milliseconds(20);

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Clears the busy flag on every exit path.
class BusyScope {
public:
    explicit BusyScope(std::atomic_bool& flag) : flag_(flag) { flag_ = true; }
    ~BusyScope() { flag_ = false; }
    BusyScope(const BusyScope&) = delete;
    BusyScope& operator=(const BusyScope&) = delete;

private:
    std::atomic_bool& flag_;
};

}  // namespace

std::string to_string(const ConfirmationAction action) {
    switch (action) {
        case ConfirmationAction::Approve:
            return "approve";
        case ConfirmationAction::Deny:
            return "deny";
        case ConfirmationAction::Edit:
            return "edit";
        case ConfirmationAction::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

std::string shell_line(const std::string& command) {
    std::string line = command;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    if (line.find_first_of("\r\n") == std::string::npos) {
        return line;
    }

    std::string quoted = "eval $'";
    for (const char c : line) {
        switch (c) {
            case '\\':
                quoted += "\\\\";
                break;
            case '\'':
                quoted += "\\'";
                break;
            case '\n':
                quoted += "\\n";
                break;
            case '\r':
                quoted += "\\r";
                break;
            default:
                quoted.push_back(c);
                break;
        }
    }
    quoted += "'";
    return quoted;
}

AdmissionPipeline::AdmissionPipeline(terminal::TerminalPort& terminal,
                                     terminal::OutputBuffer& output,
                                     policy::PolicyGuard guard,
                                     ConfirmationCallback on_confirmation_needed)
    : terminal_(terminal),
      output_(output),
      guard_(std::move(guard)),
      on_confirmation_needed_(std::move(on_confirmation_needed)) {}

core::errors::Result<bool> AdmissionPipeline::initialize(
    const std::string& bootstrap_line, const std::chrono::milliseconds startup_timeout) {
    std::lock_guard<std::timed_mutex> lock(terminal_mutex_);

    const std::uint64_t window_start = output_.snapshot().end_offset;
    if (!bootstrap_line.empty()) {
        auto written = terminal_.write(std::string(1, kKillLine) + bootstrap_line + "\n");
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
    }

    const auto deadline = Clock::now() + startup_timeout;
    const auto wait = bootstrap_line.empty()
                          ? output_.wait_for_marker(0, deadline, &shutting_down_)
                          : output_.wait_for_command_end(window_start, deadline, &shutting_down_);
    switch (wait.status) {
        case WaitStatus::Marker:
            owed_window_.reset();
            SHELLGATE_LOG_INFO("AdmissionPipeline: shell prompt detected, ready for commands");
            return true;
        case WaitStatus::Closed:
            return GateError{ErrorCategory::Spawn, "Shell exited during startup.",
                             "session_closed"};
        case WaitStatus::Cancelled:
            return GateError{ErrorCategory::Cancelled, "Agent is shutting down.",
                             "agent_shutting_down"};
        case WaitStatus::TimedOut:
        default:
            return GateError{ErrorCategory::Timeout,
                             "Shell did not print a prompt marker within " +
                                 std::to_string(startup_timeout.count()) + " ms.",
                             "startup_timeout",
                             "Check shell.bootstrap; each prompt must emit ESC ]133;D;<exit>;<token> BEL."};
    }
}

void AdmissionPipeline::shutdown() {
    shutting_down_ = true;
}

std::optional<ExecutionResult> AdmissionPipeline::unavailable(const ExecutionRequest& request,
                                                              const std::atomic_bool* cancel) {
    if (shutting_down_ || (cancel != nullptr && cancel->load())) {
        return make_result(request.id, ExecutionStatus::Error, "agent shutting down");
    }
    if (output_.closed() || !terminal_.is_alive()) {
        return make_result(request.id, ExecutionStatus::Error, "terminal session unavailable");
    }
    return std::nullopt;
}

ExecutionResult AdmissionPipeline::execute(const ExecutionRequest& request,
                                           std::shared_ptr<std::atomic_bool> cancel_token) {
    const std::atomic_bool* cancel = cancel_token ? cancel_token.get() : &shutting_down_;

    if (auto early = unavailable(request, cancel)) {
        return *early;
    }

    const auto decision = guard_.evaluate(request.command, request.mode);
    SHELLGATE_LOG_INFO("AdmissionPipeline: " + request.id + " [" +
                       protocol::to_string(request.mode) + "] verdict=" +
                       policy::to_string(decision.verdict));

    if (decision.verdict == Verdict::Deny) {
        return make_result(request.id, ExecutionStatus::Denied, decision.reason);
    }
    if (decision.verdict == Verdict::RequireConfirmation) {
        return confirm_then_run(request, cancel);
    }
    if (request.mode == ExecutionMode::Review) {
        return run_staged(request, request.command, cancel);
    }
    return run_submitted(request, request.command, cancel);
}

ExecutionResult AdmissionPipeline::confirm_then_run(const ExecutionRequest& request,
                                                    const std::atomic_bool* cancel) {
    if (!on_confirmation_needed_) {
        return make_result(request.id, ExecutionStatus::Denied,
                           "no confirmation surface attached");
    }

    const auto answer = on_confirmation_needed_(request, request.timeout);
    if (!answer.has_value()) {
        return make_result(request.id, ExecutionStatus::TimedOut,
                           "No operator decision within the timeout.");
    }
    if (auto early = unavailable(request, cancel)) {
        return *early;
    }

    SHELLGATE_LOG_INFO("AdmissionPipeline: " + request.id + " operator decision=" +
                       to_string(answer->action));

    std::string command = request.command;
    switch (answer->action) {
        case ConfirmationAction::Approve:
            break;
        case ConfirmationAction::Edit:
            command = answer->edited_command;
            break;
        case ConfirmationAction::Deny:
            return make_result(request.id, ExecutionStatus::Denied,
                               answer->reason.empty() ? "Operator denied the command."
                                                      : answer->reason);
        case ConfirmationAction::Cancelled:
        default:
            return make_result(request.id, ExecutionStatus::Denied,
                               answer->reason.empty() ? "Confirmation was cancelled."
                                                      : answer->reason);
    }

    // An approved or edited command is checked again, but the operator's
    // answer already covers confirmation.
    const auto recheck = guard_.evaluate(command, ExecutionMode::Autonomous);
    if (recheck.verdict == Verdict::Deny) {
        return make_result(request.id, ExecutionStatus::Denied, recheck.reason);
    }
    if (request.mode == ExecutionMode::Review) {
        return run_staged(request, command, cancel);
    }
    return run_submitted(request, command, cancel);
}

bool AdmissionPipeline::settle(const Clock::time_point deadline,
                               const std::atomic_bool* cancel) {
    if (owed_window_.has_value()) {
        const auto wait = output_.wait_for_command_end(*owed_window_, deadline, cancel);
        if (wait.status != WaitStatus::Marker) {
            return false;
        }
        owed_window_.reset();
    }
    // A job started from the live terminal owns the input; typing would feed it.
    while (!terminal_.is_idle()) {
        if (output_.closed() || (cancel != nullptr && cancel->load()) ||
            Clock::now() + kIdlePoll > deadline) {
            return false;
        }
        std::this_thread::sleep_for(kIdlePoll);
    }
    return true;
}

ExecutionResult AdmissionPipeline::finish_wait(const ExecutionRequest& request,
                                               const MarkerWait& wait,
                                               const std::uint64_t window_start) {
    switch (wait.status) {
        case WaitStatus::Marker: {
            ExecutionResult result;
            result.id = request.id;
            result.status = ExecutionStatus::Completed;
            result.exit_code = wait.marker.exit_code;
            result.stdout_text = terminal::extract_command_output(
                output_.slice(window_start, wait.marker.offset));
            return result;
        }
        case WaitStatus::Closed:
            return make_result(request.id, ExecutionStatus::Error,
                               "terminal session unavailable");
        case WaitStatus::Cancelled:
            return make_result(request.id, ExecutionStatus::Error, "agent shutting down");
        case WaitStatus::TimedOut:
        default: {
            auto result = make_result(request.id, ExecutionStatus::TimedOut,
                                      "Command did not finish within " +
                                          std::to_string(request.timeout.count()) + " ms.");
            result.stdout_text = terminal::extract_command_output(
                output_.slice(window_start, output_.snapshot().end_offset));
            return result;
        }
    }
}

ExecutionResult AdmissionPipeline::run_submitted(const ExecutionRequest& request,
                                                 const std::string& command,
                                                 const std::atomic_bool* cancel) {
    const auto deadline = Clock::now() + request.timeout;

    std::unique_lock<std::timed_mutex> lock(terminal_mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return make_result(request.id, ExecutionStatus::TimedOut, "shell busy");
    }
    BusyScope busy(busy_);

    if (auto early = unavailable(request, cancel)) {
        return *early;
    }
    if (!settle(deadline, cancel)) {
        if (auto early = unavailable(request, cancel)) {
            return *early;
        }
        return make_result(request.id, ExecutionStatus::TimedOut, "shell busy");
    }

    const std::uint64_t window_start = output_.snapshot().end_offset;
    auto written = terminal_.write(std::string(1, kKillLine) + shell_line(command) + "\n");
    if (core::errors::is_error(written)) {
        const auto& error = core::errors::get_error(written);
        SHELLGATE_LOG_ERROR("AdmissionPipeline: write failed for " + request.id + ": " +
                            error.message);
        return make_result(request.id, ExecutionStatus::Error, error.message);
    }

    const auto wait = output_.wait_for_command_end(window_start, deadline, cancel);
    if (wait.status == WaitStatus::TimedOut || wait.status == WaitStatus::Cancelled) {
        owed_window_ = window_start;
        SHELLGATE_LOG_WARN("AdmissionPipeline: " + request.id +
                           " ended before its prompt came back; the shell stays busy");
    }
    return finish_wait(request, wait, window_start);
}

ExecutionResult AdmissionPipeline::run_staged(const ExecutionRequest& request,
                                              const std::string& command,
                                              const std::atomic_bool* cancel) {
    const auto deadline = Clock::now() + request.timeout;

    std::unique_lock<std::timed_mutex> lock(terminal_mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return make_result(request.id, ExecutionStatus::TimedOut, "shell busy");
    }
    BusyScope busy(busy_);

    if (auto early = unavailable(request, cancel)) {
        return *early;
    }
    if (!settle(deadline, cancel)) {
        if (auto early = unavailable(request, cancel)) {
            return *early;
        }
        return make_result(request.id, ExecutionStatus::TimedOut, "shell busy");
    }

    const std::uint64_t window_start = output_.snapshot().end_offset;
    auto written = terminal_.write(std::string(1, kKillLine) + shell_line(command));
    if (core::errors::is_error(written)) {
        return make_result(request.id, ExecutionStatus::Error,
                           core::errors::get_error(written).message);
    }
    SHELLGATE_LOG_INFO("AdmissionPipeline: " + request.id + " staged for operator review");

    // Only a prompt after the operator's Enter counts; redraws of the staged
    // line do not.
    auto wait = output_.wait_for_command_end(window_start, deadline, cancel);
    if (wait.status == WaitStatus::TimedOut && terminal_.is_idle()) {
        // The operator may have pressed Enter just before the deadline.
        wait = output_.wait_for_command_end(window_start, Clock::now() + kIdleRecheck, cancel);
        if (wait.status == WaitStatus::TimedOut && !output_.has_line_break_since(window_start)) {
            auto retracted = terminal_.write(std::string(1, kKillLine));
            if (core::errors::is_error(retracted)) {
                SHELLGATE_LOG_WARN("AdmissionPipeline: could not retract staged command: " +
                                   core::errors::get_error(retracted).message);
            }
            return make_result(request.id, ExecutionStatus::TimedOut,
                               "Operator did not submit the staged command.");
        }
    }
    if (wait.status == WaitStatus::TimedOut ||
        (wait.status == WaitStatus::Cancelled && output_.has_line_break_since(window_start))) {
        owed_window_ = window_start;
        SHELLGATE_LOG_WARN("AdmissionPipeline: " + request.id +
                           " submitted but still running at timeout");
    }
    return finish_wait(request, wait, window_start);
}

}  // namespace shellgate::runtime
