#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/execution_contract.hpp"
#include "terminal/output_buffer.hpp"
#include "terminal/terminal_session.hpp"

namespace shellgate::runtime {

enum class ConfirmationAction {
    Approve,
    Deny,
    Edit,
    Cancelled
};

struct ConfirmationDecision {
    ConfirmationAction action = ConfirmationAction::Cancelled;
    std::string edited_command;   // set for Edit
    std::string reason;           // optional note for Deny/Cancelled
};

std::string to_string(ConfirmationAction action);

// Asks a human about `request`. Returns nullopt when no decision arrived
// within the given time; the prompt is withdrawn by then.
using ConfirmationCallback = std::function<std::optional<ConfirmationDecision>(
    const protocol::ExecutionRequest& request, std::chrono::milliseconds timeout)>;

// Kill-line (^U): clears whatever is staged on the shell's input line.
inline constexpr char kKillLine = '\x15';

// The line actually typed for `command`. Trailing line breaks are dropped; a
// command that still spans lines is wrapped as eval $'...' so the shell reads
// it as one line and prints one prompt.
std::string shell_line(const std::string& command);

class AdmissionPipeline {
public:
    AdmissionPipeline(terminal::TerminalPort& terminal, terminal::OutputBuffer& output,
                      policy::PolicyGuard guard, ConfirmationCallback on_confirmation_needed);

    AdmissionPipeline(const AdmissionPipeline&) = delete;
    AdmissionPipeline& operator=(const AdmissionPipeline&) = delete;

    // Writes the prompt-marker bootstrap line and waits for the marker that
    // follows it. An empty bootstrap only waits for any marker.
    core::errors::Result<bool> initialize(const std::string& bootstrap_line,
                                          std::chrono::milliseconds startup_timeout);

    // Produces exactly one result per request. Denials and timeouts are
    // statuses, not errors.
    protocol::ExecutionResult execute(const protocol::ExecutionRequest& request,
                                      std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

    // Every later or waiting request finishes with status=error.
    void shutdown();

    bool busy() const { return busy_.load(); }
    const policy::PolicyGuard& guard() const { return guard_; }

private:
    using Clock = std::chrono::steady_clock;

    protocol::ExecutionResult confirm_then_run(const protocol::ExecutionRequest& request,
                                               const std::atomic_bool* cancel);
    protocol::ExecutionResult run_submitted(const protocol::ExecutionRequest& request,
                                            const std::string& command,
                                            const std::atomic_bool* cancel);
    protocol::ExecutionResult run_staged(const protocol::ExecutionRequest& request,
                                         const std::string& command,
                                         const std::atomic_bool* cancel);

    // Waits until an earlier timed-out command has printed its prompt and no
    // foreground job holds the terminal.
    bool settle(Clock::time_point deadline, const std::atomic_bool* cancel);
    protocol::ExecutionResult finish_wait(const protocol::ExecutionRequest& request,
                                          const terminal::MarkerWait& wait,
                                          std::uint64_t window_start);
    std::optional<protocol::ExecutionResult> unavailable(const protocol::ExecutionRequest& request,
                                                         const std::atomic_bool* cancel);

    terminal::TerminalPort& terminal_;
    terminal::OutputBuffer& output_;
    policy::PolicyGuard guard_;
    ConfirmationCallback on_confirmation_needed_;

    // Held around write-then-await; the single serialisation point.
    std::timed_mutex terminal_mutex_;
    // Window start of a command that timed out before its prompt came back.
    std::optional<std::uint64_t> owed_window_;
    std::atomic_bool shutting_down_{false};
    std::atomic_bool busy_{false};
};

}  // namespace shellgate::runtime
