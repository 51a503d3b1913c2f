#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace shellgate::session {

// Append-only JSONL record of what was asked, decided and returned.
// An empty path disables it; every call then succeeds without writing.
class AuditLog {
public:
    explicit AuditLog(std::filesystem::path path);

    bool enabled() const { return !path_.empty(); }
    const std::filesystem::path& path() const { return path_; }

    core::errors::Result<bool> record_request(const protocol::ExecutionRequest& request);
    core::errors::Result<bool> record_decision(const std::string& id, const std::string& decision,
                                               const std::string& reason);
    core::errors::Result<bool> record_result(const protocol::ExecutionResult& result);

private:
    core::errors::Result<bool> append_event(const std::string& event, const std::string& id,
                                            const nlohmann::json& payload);

    std::filesystem::path path_;
    std::mutex mutex_;
};

}  // namespace shellgate::session
