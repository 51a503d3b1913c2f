#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "core/config/agent_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "ipc/ipc_server.hpp"
#include "protocol/envelope.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/admission_pipeline.hpp"
#include "session/audit_log.hpp"
#include "session/request_tracker.hpp"
#include "terminal/output_buffer.hpp"
#include "terminal/terminal_session.hpp"
#include "ui/confirmation_broker.hpp"
#include "ui/terminal_view.hpp"

namespace shellgate::agent {

// Owns the shell and everything that talks to it: the output pump, the
// admission pipeline, the IPC listener and the optional confirmation surface.
class ShellAgent {
public:
    explicit ShellAgent(core::config::AgentConfig config);
    ~ShellAgent();

    ShellAgent(const ShellAgent&) = delete;
    ShellAgent& operator=(const ShellAgent&) = delete;

    // Must be called before start(). Without a surface, requests that need a
    // human decision are denied.
    void attach_surface(ui::ConfirmationBroker& broker, ui::TerminalView& view);

    // Spawns the shell, waits for its first prompt and starts listening.
    core::errors::Result<bool> start();

    // Cancels pending work, closes every connection and ends the shell. Idempotent.
    void stop();

    protocol::Envelope handle(const protocol::Envelope& request);
    protocol::ExecutionResult execute(const protocol::ExecutionRequest& request);

    core::errors::Result<bool> resize(unsigned short rows, unsigned short cols);
    // Raw keystrokes from the operator; they bypass admission.
    void send_keys(const std::string& bytes);

    bool available() const { return available_.load(); }
    nlohmann::json status() const;
    std::string status_line() const;
    const std::string& socket_path() const { return config_.socket_path; }

private:
    void pump_output();
    void mark_unavailable(const std::string& reason);
    std::optional<runtime::ConfirmationDecision> confirm(
        const protocol::ExecutionRequest& request, std::chrono::milliseconds timeout);
    protocol::Envelope handle_execute(const protocol::Envelope& request);
    protocol::Envelope handle_resize(const protocol::Envelope& request);

    core::config::AgentConfig config_;
    // Random per agent; prompt markers without it are plain output.
    std::string marker_token_;
    terminal::OutputBuffer output_;
    std::unique_ptr<terminal::TerminalSession> session_;
    std::unique_ptr<runtime::AdmissionPipeline> pipeline_;
    std::unique_ptr<ipc::IpcServer> server_;
    session::RequestTracker tracker_;
    session::AuditLog audit_;
    ui::ConfirmationBroker* broker_ = nullptr;
    ui::TerminalView* view_ = nullptr;

    std::thread pump_thread_;
    std::atomic_bool pumping_{false};
    std::atomic_bool available_{false};
    std::mutex lifecycle_mutex_;
    bool started_ = false;
    bool stopped_ = false;
};

}  // namespace shellgate::agent
