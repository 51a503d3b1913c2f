#include "session/audit_log.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>

namespace shellgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

AuditLog::AuditLog(std::filesystem::path path) : path_(std::move(path)) {}

core::errors::Result<bool> AuditLog::append_event(const std::string& event,
                                                  const std::string& id,
                                                  const json& payload) {
    if (!enabled()) {
        return true;
    }

    json line;
    line["ts_unix_ms"] = now_unix_ms();
    line["event"] = event;
    line["id"] = id;
    line["payload"] = payload;
    const std::string serialized = line.dump(-1, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return GateError{ErrorCategory::Internal,
                             "Unable to create audit directory: " +
                                 path_.parent_path().string(),
                             "audit_dir_create_failed"};
        }
    }

    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        return GateError{ErrorCategory::Internal, "Unable to open audit log: " + path_.string(),
                         "audit_open_failed"};
    }
    out << serialized << "\n";
    if (!out.good()) {
        return GateError{ErrorCategory::Internal,
                         "Unable to write audit event: " + path_.string(),
                         "audit_write_failed"};
    }
    return true;
}

core::errors::Result<bool> AuditLog::record_request(const protocol::ExecutionRequest& request) {
    json payload;
    payload["command"] = request.command;
    payload["mode"] = protocol::to_string(request.mode);
    payload["timeout_ms"] = request.timeout.count();
    return append_event("request", request.id, payload);
}

core::errors::Result<bool> AuditLog::record_decision(const std::string& id,
                                                     const std::string& decision,
                                                     const std::string& reason) {
    json payload;
    payload["decision"] = decision;
    payload["reason"] = reason;
    return append_event("decision", id, payload);
}

core::errors::Result<bool> AuditLog::record_result(const protocol::ExecutionResult& result) {
    json payload;
    payload["status"] = protocol::to_string(result.status);
    payload["exit_code"] = result.exit_code.has_value() ? json(*result.exit_code) : json();
    payload["stdout_bytes"] = result.stdout_text.size();
    payload["stderr"] = result.stderr_text;
    return append_event("result", result.id, payload);
}

}  // namespace shellgate::session
