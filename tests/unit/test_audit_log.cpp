#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/request_id.hpp"
#include "core/errors/gate_errors.hpp"
#include "session/audit_log.hpp"

namespace {

using nlohmann::json;
using shellgate::core::errors::is_error;
using shellgate::protocol::ExecutionMode;
using shellgate::protocol::ExecutionRequest;
using shellgate::protocol::ExecutionResult;
using shellgate::protocol::ExecutionStatus;
using shellgate::session::AuditLog;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                (".tmp_audit_log_" + shellgate::core::config::generate_id("ws"));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<json> read_events(const std::filesystem::path& file_path) {
    std::vector<json> events;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        events.push_back(json::parse(line));
    }
    return events;
}

TEST(AuditLogTest, WritesOneLinePerEvent) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / "nested" / "audit.jsonl";
    AuditLog audit(log_path);

    ExecutionRequest request;
    request.id = "req-audit";
    request.command = "sudo apt update";
    request.mode = ExecutionMode::Tutor;
    request.timeout = std::chrono::milliseconds(5000);
    ASSERT_FALSE(is_error(audit.record_request(request)));
    ASSERT_FALSE(is_error(audit.record_decision("req-audit", "edit", "operator edited")));

    ExecutionResult result;
    result.id = "req-audit";
    result.status = ExecutionStatus::Completed;
    result.exit_code = 0;
    result.stdout_text = "12345";
    ASSERT_FALSE(is_error(audit.record_result(result)));

    const auto events = read_events(log_path);
    ASSERT_EQ(events.size(), 3u);

    EXPECT_EQ(events[0]["event"].get<std::string>(), "request");
    EXPECT_EQ(events[0]["id"].get<std::string>(), "req-audit");
    EXPECT_EQ(events[0]["payload"]["mode"].get<std::string>(), "tutor");
    EXPECT_EQ(events[0]["payload"]["timeout_ms"].get<long long>(), 5000);
    EXPECT_TRUE(events[0]["ts_unix_ms"].is_number_integer());

    EXPECT_EQ(events[1]["event"].get<std::string>(), "decision");
    EXPECT_EQ(events[1]["payload"]["decision"].get<std::string>(), "edit");

    EXPECT_EQ(events[2]["event"].get<std::string>(), "result");
    EXPECT_EQ(events[2]["payload"]["status"].get<std::string>(), "completed");
    EXPECT_EQ(events[2]["payload"]["exit_code"].get<int>(), 0);
    EXPECT_EQ(events[2]["payload"]["stdout_bytes"].get<std::size_t>(), 5u);
}

TEST(AuditLogTest, AppendsAcrossInstances) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / "audit.jsonl";
    {
        AuditLog audit(log_path);
        ASSERT_FALSE(is_error(audit.record_decision("a", "approve", "")));
    }
    AuditLog audit(log_path);
    ASSERT_FALSE(is_error(audit.record_decision("b", "deny", "no")));
    EXPECT_EQ(read_events(log_path).size(), 2u);
}

TEST(AuditLogTest, RecordsNullExitCodeForDeniedRequest) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / "audit.jsonl";
    AuditLog audit(log_path);

    ExecutionResult result;
    result.id = "req-denied";
    result.status = ExecutionStatus::Denied;
    result.stderr_text = "Blocked by policy";
    ASSERT_FALSE(is_error(audit.record_result(result)));

    const auto events = read_events(log_path);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0]["payload"]["exit_code"].is_null());
    EXPECT_EQ(events[0]["payload"]["stderr"].get<std::string>(), "Blocked by policy");
}

TEST(AuditLogTest, EmptyPathDisablesLogging) {
    AuditLog audit("");
    EXPECT_FALSE(audit.enabled());
    EXPECT_FALSE(is_error(audit.record_decision("req", "approve", "")));
}

TEST(AuditLogTest, ReportsUnwritableLocation) {
    TempWorkspace workspace;
    const auto blocker = workspace.root() / "blocker";
    { std::ofstream(blocker) << "not a directory"; }

    AuditLog audit(blocker / "audit.jsonl");
    auto written = audit.record_decision("req", "approve", "");
    ASSERT_TRUE(is_error(written));
    EXPECT_EQ(shellgate::core::errors::get_error(written).code, "audit_dir_create_failed");
}

}  // namespace
