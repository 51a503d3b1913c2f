#include "agent/shell_agent.hpp"

#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/message_codec.hpp"

namespace shellgate::agent {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;
using protocol::Envelope;
using protocol::ExecutionRequest;
using protocol::ExecutionResult;
using protocol::ExecutionStatus;
using runtime::ConfirmationAction;
using runtime::ConfirmationDecision;

namespace {

constexpr auto kPumpPoll = std::chrono::milliseconds(100);

bool read_dimension(const json& payload, const char* key, unsigned short& out) {
    const auto it = payload.find(key);
    if (it == payload.end() || !it->is_number_integer()) {
        return false;
    }
    const auto value = it->get<long long>();
    if (value <= 0 || value > 0xffff) {
        return false;
    }
    out = static_cast<unsigned short>(value);
    return true;
}

}  // namespace

ShellAgent::ShellAgent(core::config::AgentConfig config)
    : config_(std::move(config)),
      marker_token_(config_.shell.bootstrap.find(core::config::kMarkerTokenPlaceholder) !=
                            std::string::npos
                        ? core::config::generate_id("sg")
                        : ""),
      output_(config_.max_output_bytes, marker_token_),
      audit_(config_.audit_log) {}

ShellAgent::~ShellAgent() {
    stop();
}

void ShellAgent::attach_surface(ui::ConfirmationBroker& broker, ui::TerminalView& view) {
    broker_ = &broker;
    view_ = &view;
}

core::errors::Result<bool> ShellAgent::start() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (started_) {
            return GateError{ErrorCategory::Internal, "Agent was already started.",
                             "already_started"};
        }
        started_ = true;
    }

    auto guard = policy::PolicyGuard::create(config_.policy);
    if (core::errors::is_error(guard)) {
        return core::errors::get_error(guard);
    }

    terminal::SpawnOptions spawn_options;
    spawn_options.shell_path = config_.shell.path;
    spawn_options.args = config_.shell.args;
    auto spawned = terminal::TerminalSession::spawn(spawn_options);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    session_ = core::errors::take_value(spawned);

    pumping_ = true;
    pump_thread_ = std::thread(&ShellAgent::pump_output, this);

    pipeline_ = std::make_unique<runtime::AdmissionPipeline>(
        *session_, output_, core::errors::take_value(guard),
        [this](const ExecutionRequest& request, const std::chrono::milliseconds timeout) {
            return confirm(request, timeout);
        });

    if (marker_token_.empty()) {
        SHELLGATE_LOG_WARN("ShellAgent: shell.bootstrap has no " +
                           std::string(core::config::kMarkerTokenPlaceholder) +
                           "; command output can forge prompt markers");
    }
    auto ready = pipeline_->initialize(
        core::config::render_bootstrap(config_.shell.bootstrap, marker_token_),
        std::chrono::seconds(config_.startup_timeout_seconds));
    if (core::errors::is_error(ready)) {
        stop();
        return core::errors::get_error(ready);
    }
    available_ = true;

    server_ = std::make_unique<ipc::IpcServer>(
        config_.socket_path, [this](const Envelope& request) { return handle(request); });
    auto listening = server_->start();
    if (core::errors::is_error(listening)) {
        stop();
        return core::errors::get_error(listening);
    }

    SHELLGATE_LOG_INFO("ShellAgent: ready (shell PID " + std::to_string(session_->pid()) +
                       ", socket " + config_.socket_path + ")");
    return true;
}

void ShellAgent::pump_output() {
    while (pumping_) {
        auto chunk = session_->read_available(kPumpPoll);
        if (core::errors::is_error(chunk)) {
            mark_unavailable(core::errors::get_error(chunk).message);
            return;
        }
        const auto& bytes = core::errors::get_value(chunk);
        if (bytes.empty()) {
            if (!session_->is_alive()) {
                mark_unavailable("Shell process exited.");
                return;
            }
            continue;
        }
        output_.append(bytes);
        if (view_ != nullptr) {
            view_->feed(bytes);
        }
    }
}

void ShellAgent::mark_unavailable(const std::string& reason) {
    if (available_.exchange(false) || !output_.closed()) {
        SHELLGATE_LOG_ERROR("ShellAgent: terminal session unavailable: " + reason);
    }
    output_.close();
}

std::optional<ConfirmationDecision> ShellAgent::confirm(const ExecutionRequest& request,
                                                        const std::chrono::milliseconds timeout) {
    std::optional<ConfirmationDecision> decision;
    if (broker_ == nullptr) {
        decision = ConfirmationDecision{ConfirmationAction::Cancelled, "",
                                        "no confirmation surface attached"};
    } else {
        decision = broker_->request_decision(request, timeout);
    }

    auto audited = decision.has_value()
                       ? audit_.record_decision(request.id, runtime::to_string(decision->action),
                                                decision->action == ConfirmationAction::Edit
                                                    ? decision->edited_command
                                                    : decision->reason)
                       : audit_.record_decision(request.id, "timeout", "No operator decision.");
    if (core::errors::is_error(audited)) {
        SHELLGATE_LOG_WARN("ShellAgent: audit failed: " + core::errors::get_error(audited).message);
    }
    return decision;
}

ExecutionResult ShellAgent::execute(const ExecutionRequest& request) {
    if (!pipeline_) {
        return protocol::make_result(request.id, ExecutionStatus::Error,
                                     "terminal session unavailable");
    }

    auto begun = tracker_.begin(request);
    if (core::errors::is_error(begun)) {
        return protocol::make_result(request.id, ExecutionStatus::Error,
                                     core::errors::get_error(begun).message);
    }
    auto cancel_token = core::errors::get_value(begun);

    auto audited = audit_.record_request(request);
    if (core::errors::is_error(audited)) {
        SHELLGATE_LOG_WARN("ShellAgent: audit failed: " + core::errors::get_error(audited).message);
    }

    ExecutionResult result = pipeline_->execute(request, cancel_token);

    auto finished = tracker_.finish(request.id, result.status);
    if (core::errors::is_error(finished)) {
        SHELLGATE_LOG_ERROR("ShellAgent: " + core::errors::get_error(finished).message);
    }
    audited = audit_.record_result(result);
    if (core::errors::is_error(audited)) {
        SHELLGATE_LOG_WARN("ShellAgent: audit failed: " + core::errors::get_error(audited).message);
    }
    SHELLGATE_LOG_INFO("ShellAgent: " + request.id + " -> " + protocol::to_string(result.status));
    return result;
}

Envelope ShellAgent::handle(const Envelope& request) {
    if (request.type == protocol::message_type::kExecute) {
        return handle_execute(request);
    }
    if (request.type == protocol::message_type::kResize) {
        return handle_resize(request);
    }
    if (request.type == protocol::message_type::kStatus) {
        return Envelope{request.id, protocol::message_type::kStatus, status()};
    }
    return protocol::error_envelope(
        request.id, GateError{ErrorCategory::Input, "Unknown message type: " + request.type,
                              "unknown_type"});
}

Envelope ShellAgent::handle_execute(const Envelope& request) {
    auto parsed = protocol::request_from_envelope(
        request, std::chrono::seconds(config_.default_timeout_seconds));
    if (core::errors::is_error(parsed)) {
        return protocol::error_envelope(request.id, core::errors::get_error(parsed));
    }
    return protocol::result_to_envelope(execute(core::errors::get_value(parsed)));
}

Envelope ShellAgent::handle_resize(const Envelope& request) {
    unsigned short rows = 0;
    unsigned short cols = 0;
    if (!read_dimension(request.payload, "rows", rows) ||
        !read_dimension(request.payload, "cols", cols)) {
        return protocol::error_envelope(
            request.id, GateError{ErrorCategory::Input,
                                  "Resize needs positive integer 'rows' and 'cols'.",
                                  "invalid_size"});
    }
    auto resized = resize(rows, cols);
    if (core::errors::is_error(resized)) {
        return protocol::error_envelope(request.id, core::errors::get_error(resized));
    }
    return Envelope{request.id, protocol::message_type::kAck, json::object()};
}

core::errors::Result<bool> ShellAgent::resize(const unsigned short rows, const unsigned short cols) {
    if (!session_ || !available()) {
        return GateError{ErrorCategory::Transport, "terminal session unavailable",
                         "session_closed"};
    }
    return session_->resize(rows, cols);
}

void ShellAgent::send_keys(const std::string& bytes) {
    if (!session_ || !available()) {
        return;
    }
    auto written = session_->write(bytes);
    if (core::errors::is_error(written)) {
        SHELLGATE_LOG_WARN("ShellAgent: keystrokes dropped: " +
                           core::errors::get_error(written).message);
    }
}

json ShellAgent::status() const {
    json payload;
    payload["alive"] = available();
    payload["pid"] = session_ ? json(session_->pid()) : json();
    payload["busy"] = pipeline_ ? pipeline_->busy() : false;
    payload["in_flight"] = tracker_.in_flight_count();
    payload["pending_confirmations"] = broker_ != nullptr ? broker_->pending_count() : 0;
    payload["surface"] = broker_ != nullptr;

    std::optional<std::filesystem::path> cwd;
    if (session_ && available()) {
        cwd = session_->current_working_directory();
    }
    payload["cwd"] = cwd.has_value() ? json(cwd->string()) : json();
    return payload;
}

std::string ShellAgent::status_line() const {
    if (!available()) {
        return "shell unavailable";
    }
    std::string line = "shell " + std::to_string(session_->pid());
    line += pipeline_ && pipeline_->busy() ? " busy" : " idle";
    return line;
}

void ShellAgent::stop() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    SHELLGATE_LOG_INFO("ShellAgent: shutting down");

    if (pipeline_) {
        pipeline_->shutdown();
    }
    const std::size_t cancelled = tracker_.cancel_all();
    if (cancelled > 0) {
        SHELLGATE_LOG_WARN("ShellAgent: cancelled " + std::to_string(cancelled) +
                           " in-flight request(s)");
    }
    if (broker_ != nullptr) {
        broker_->cancel_all("Agent is shutting down.");
    }
    if (server_) {
        server_->stop();
    }

    pumping_ = false;
    if (pump_thread_.joinable()) {
        pump_thread_.join();
    }
    available_ = false;
    output_.close();
    if (session_) {
        session_->terminate();
    }
}

}  // namespace shellgate::agent
