#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/gate_errors.hpp"
#include "policy/policy_guard.hpp"
#include "runtime/admission_pipeline.hpp"
#include "terminal/output_buffer.hpp"
#include "terminal/terminal_session.hpp"

namespace {

using shellgate::core::errors::get_error;
using shellgate::core::errors::get_value;
using shellgate::core::errors::is_error;
using shellgate::policy::PolicyGuard;
using shellgate::protocol::ExecutionMode;
using shellgate::protocol::ExecutionRequest;
using shellgate::protocol::ExecutionResult;
using shellgate::protocol::ExecutionStatus;
using shellgate::runtime::AdmissionPipeline;
using shellgate::runtime::ConfirmationAction;
using shellgate::runtime::ConfirmationCallback;
using shellgate::runtime::ConfirmationDecision;
using shellgate::runtime::kKillLine;
using shellgate::runtime::shell_line;
using shellgate::terminal::OutputBuffer;
using shellgate::terminal::TerminalPort;

std::string marker(int exit_code) {
    return "\x1b]133;D;" + std::to_string(exit_code) + "\x07";
}

// Stands in for an interactive shell: echoes what is typed, and for every
// submitted line prints the scripted output followed by a prompt marker.
class FakeTerminal : public TerminalPort {
public:
    struct Script {
        std::string output;
        int exit_code = 0;
    };

    explicit FakeTerminal(OutputBuffer& output) : output_(output) {}

    shellgate::core::errors::Result<std::size_t> write(const std::string& bytes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        writes_.push_back(bytes);
        std::string text = bytes;
        if (!text.empty() && text.front() == kKillLine) {
            text.erase(0, 1);
            staged_.clear();
            if (redraw_on_kill_) {
                output_.append("\r" + marker(last_exit_) + "$ ");
            }
        }
        if (text.empty() || text.back() != '\n') {
            staged_ += text;
            output_.append(text);
            return bytes.size();
        }
        text.pop_back();
        staged_.clear();
        output_.append(text);
        run_line(text);
        return bytes.size();
    }

    bool is_alive() override { return alive_; }

    bool is_idle() const override { return !running_; }

    // The operator pressing Enter on whatever is staged.
    void press_enter() {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string line = staged_;
        staged_.clear();
        run_line(line);
    }

    // Ends the command that never printed its marker.
    void finish_running(const int exit_code) {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        output_.append(marker(exit_code) + "$ ");
    }

    void script(const std::string& line, const std::string& output, const int exit_code = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[line] = Script{output, exit_code};
    }

    void hang_on(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        hanging_.insert(line);
    }

    // Reprints the whole prompt, marker included, whenever the line is killed.
    void set_redraw_on_kill(const bool redraw) { redraw_on_kill_ = redraw; }
    void set_alive(const bool alive) { alive_ = alive; }
    void set_silent(const bool silent) { silent_ = silent; }

    std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

private:
    void run_line(const std::string& line) {
        output_.append("\r\n");
        if (silent_) {
            return;
        }
        if (hanging_.count(line) > 0) {
            running_ = true;
            output_.append("working...\r\n");
            return;
        }
        Script result;
        const auto it = scripts_.find(line);
        if (it != scripts_.end()) {
            result = it->second;
        }
        std::string crlf;
        for (const char c : result.output) {
            if (c == '\n') {
                crlf += "\r\n";
            } else {
                crlf.push_back(c);
            }
        }
        last_exit_ = result.exit_code;
        output_.append(crlf + marker(result.exit_code) + "$ ");
    }

    OutputBuffer& output_;
    mutable std::mutex mutex_;
    std::vector<std::string> writes_;
    std::string staged_;
    std::map<std::string, Script> scripts_;
    std::set<std::string> hanging_;
    std::atomic_bool alive_{true};
    std::atomic_bool running_{false};
    std::atomic_bool silent_{false};
    std::atomic_bool redraw_on_kill_{false};
    int last_exit_ = 0;
};

PolicyGuard default_guard() {
    auto created = PolicyGuard::create();
    EXPECT_FALSE(is_error(created));
    return get_value(created);
}

ExecutionRequest make_request(const std::string& id, const std::string& command,
                              const ExecutionMode mode = ExecutionMode::Autonomous,
                              const std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
    ExecutionRequest request;
    request.id = id;
    request.command = command;
    request.mode = mode;
    request.timeout = timeout;
    return request;
}

// Answers every prompt with a fixed decision and remembers what was asked.
struct ScriptedOperator {
    std::optional<ConfirmationDecision> answer;
    std::vector<std::string> asked;

    ConfirmationCallback callback() {
        return [this](const ExecutionRequest& request, std::chrono::milliseconds) {
            asked.push_back(request.command);
            return answer;
        };
    }
};

struct Harness {
    OutputBuffer output;
    FakeTerminal terminal{output};
    std::unique_ptr<AdmissionPipeline> pipeline;

    explicit Harness(ConfirmationCallback callback = nullptr) {
        pipeline = std::make_unique<AdmissionPipeline>(terminal, output, default_guard(),
                                                       std::move(callback));
        auto ready = pipeline->initialize("PS1=bootstrap", std::chrono::seconds(1));
        EXPECT_FALSE(is_error(ready));
    }

    std::size_t write_count() const { return terminal.writes().size(); }
};

TEST(AdmissionPipelineTest, InitializeWritesBootstrapBehindKillLine) {
    Harness harness;
    const auto writes = harness.terminal.writes();
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0], std::string(1, kKillLine) + "PS1=bootstrap\n");
}

TEST(AdmissionPipelineTest, InitializeTimesOutWithoutMarker) {
    OutputBuffer output;
    FakeTerminal terminal(output);
    terminal.set_silent(true);
    AdmissionPipeline pipeline(terminal, output, default_guard(), nullptr);

    auto ready = pipeline.initialize("PS1=bootstrap", std::chrono::milliseconds(100));
    ASSERT_TRUE(is_error(ready));
    EXPECT_EQ(get_error(ready).code, "startup_timeout");
}

TEST(AdmissionPipelineTest, RunsAutonomousCommandAndCapturesOutput) {
    Harness harness;
    harness.terminal.script("ls", "a.txt\nb.txt\n");

    const auto result = harness.pipeline->execute(make_request("req-ls", "ls"));
    EXPECT_EQ(result.id, "req-ls");
    EXPECT_EQ(result.status, ExecutionStatus::Completed);
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "a.txt\nb.txt\n");
    EXPECT_EQ(harness.terminal.writes().back(), std::string(1, kKillLine) + "ls\n");
}

TEST(AdmissionPipelineTest, NonZeroExitIsStillCompleted) {
    Harness harness;
    harness.terminal.script("false", "", 1);

    const auto result = harness.pipeline->execute(make_request("req-false", "false"));
    EXPECT_EQ(result.status, ExecutionStatus::Completed);
    EXPECT_EQ(result.exit_code.value(), 1);
    EXPECT_TRUE(result.stdout_text.empty());
}

TEST(AdmissionPipelineTest, DeniedCommandNeverReachesTerminal) {
    Harness harness;
    const auto before = harness.write_count();

    for (const auto mode : {ExecutionMode::Autonomous, ExecutionMode::Review, ExecutionMode::Tutor}) {
        const auto result = harness.pipeline->execute(make_request("req-rm", "rm -rf /", mode));
        EXPECT_EQ(result.status, ExecutionStatus::Denied);
        EXPECT_FALSE(result.stderr_text.empty());
        EXPECT_FALSE(result.exit_code.has_value());
    }
    EXPECT_EQ(harness.write_count(), before);
}

TEST(AdmissionPipelineTest, TutorEditRunsOnlyTheEditedCommand) {
    ScriptedOperator human;
    human.answer = ConfirmationDecision{ConfirmationAction::Edit, "rm -i important.txt", ""};
    Harness harness(human.callback());
    harness.terminal.script("rm -i important.txt", "");

    const auto result = harness.pipeline->execute(
        make_request("req-edit", "rm important.txt", ExecutionMode::Tutor));
    EXPECT_EQ(result.status, ExecutionStatus::Completed);
    ASSERT_EQ(human.asked.size(), 1u);
    EXPECT_EQ(human.asked[0], "rm important.txt");

    const auto writes = harness.terminal.writes();
    ASSERT_EQ(writes.size(), 2u);
    EXPECT_EQ(writes[1], std::string(1, kKillLine) + "rm -i important.txt\n");
}

TEST(AdmissionPipelineTest, TutorApproveRunsOriginalCommand) {
    ScriptedOperator human;
    human.answer = ConfirmationDecision{ConfirmationAction::Approve, "", ""};
    Harness harness(human.callback());
    harness.terminal.script("whoami", "operator\n");

    const auto result =
        harness.pipeline->execute(make_request("req-who", "whoami", ExecutionMode::Tutor));
    EXPECT_EQ(result.status, ExecutionStatus::Completed);
    EXPECT_EQ(result.stdout_text, "operator\n");
}

TEST(AdmissionPipelineTest, TutorDenyAndCancelNeverWrite) {
    ScriptedOperator human;
    Harness harness(human.callback());
    const auto before = harness.write_count();

    human.answer = ConfirmationDecision{ConfirmationAction::Deny, "", ""};
    auto result = harness.pipeline->execute(make_request("req-d", "ls", ExecutionMode::Tutor));
    EXPECT_EQ(result.status, ExecutionStatus::Denied);
    EXPECT_EQ(result.stderr_text, "Operator denied the command.");

    human.answer = ConfirmationDecision{ConfirmationAction::Cancelled, "", "surface closed"};
    result = harness.pipeline->execute(make_request("req-c", "ls", ExecutionMode::Tutor));
    EXPECT_EQ(result.status, ExecutionStatus::Denied);
    EXPECT_EQ(result.stderr_text, "surface closed");

    EXPECT_EQ(harness.write_count(), before);
}

TEST(AdmissionPipelineTest, TutorWithoutDecisionTimesOut) {
    ScriptedOperator human;
    Harness harness(human.callback());
    const auto before = harness.write_count();

    const auto result =
        harness.pipeline->execute(make_request("req-t", "ls", ExecutionMode::Tutor));
    EXPECT_EQ(result.status, ExecutionStatus::TimedOut);
    EXPECT_EQ(harness.write_count(), before);
}

TEST(AdmissionPipelineTest, EditedCommandIsStillSubjectToDenyRules) {
    ScriptedOperator human;
    human.answer = ConfirmationDecision{ConfirmationAction::Edit, "rm -rf /", ""};
    Harness harness(human.callback());
    const auto before = harness.write_count();

    const auto result =
        harness.pipeline->execute(make_request("req-e", "ls", ExecutionMode::Tutor));
    EXPECT_EQ(result.status, ExecutionStatus::Denied);
    EXPECT_EQ(harness.write_count(), before);
}

TEST(AdmissionPipelineTest, SensitiveCommandEscalatesToOperator) {
    ScriptedOperator human;
    human.answer = ConfirmationDecision{ConfirmationAction::Approve, "", ""};
    Harness harness(human.callback());

    const auto result = harness.pipeline->execute(make_request("req-sudo", "sudo apt update"));
    EXPECT_EQ(result.status, ExecutionStatus::Completed);
    ASSERT_EQ(human.asked.size(), 1u);
    EXPECT_EQ(human.asked[0], "sudo apt update");
}

TEST(AdmissionPipelineTest, ConfirmationWithoutSurfaceIsDenied) {
    Harness harness;
    const auto result =
        harness.pipeline->execute(make_request("req-h", "ls", ExecutionMode::Tutor));
    EXPECT_EQ(result.status, ExecutionStatus::Denied);
    EXPECT_EQ(result.stderr_text, "no confirmation surface attached");
}

TEST(AdmissionPipelineTest, ReviewStagesCommandUntilOperatorSubmits) {
    Harness harness;
    harness.terminal.script("ls", "a.txt\n");

    std::thread operator_thread([&harness]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        harness.terminal.press_enter();
    });
    const auto result =
        harness.pipeline->execute(make_request("req-r", "ls", ExecutionMode::Review));
    operator_thread.join();

    EXPECT_EQ(result.status, ExecutionStatus::Completed);
    EXPECT_EQ(result.stdout_text, "a.txt\n");
    const auto writes = harness.terminal.writes();
    ASSERT_EQ(writes.size(), 2u);
    EXPECT_EQ(writes[1], std::string(1, kKillLine) + "ls");
}

TEST(AdmissionPipelineTest, ReviewTimeoutRetractsStagedCommand) {
    Harness harness;
    const auto started = std::chrono::steady_clock::now();
    const auto result = harness.pipeline->execute(
        make_request("req-rt", "ls", ExecutionMode::Review, std::chrono::milliseconds(300)));

    EXPECT_EQ(result.status, ExecutionStatus::TimedOut);
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(250));
    EXPECT_EQ(harness.terminal.writes().back(), std::string(1, kKillLine));

    // The shell owes nothing; the next command runs straight away.
    harness.terminal.script("pwd", "/home\n");
    const auto next = harness.pipeline->execute(make_request("req-next", "pwd"));
    EXPECT_EQ(next.status, ExecutionStatus::Completed);
    EXPECT_EQ(next.stdout_text, "/home\n");
}

TEST(AdmissionPipelineTest, ReviewSubmittedButRunningIsNotRetracted) {
    Harness harness;
    harness.terminal.hang_on("make build");

    std::thread operator_thread([&harness]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        harness.terminal.press_enter();
    });
    const auto result = harness.pipeline->execute(make_request(
        "req-rb", "make build", ExecutionMode::Review, std::chrono::milliseconds(300)));
    operator_thread.join();

    EXPECT_EQ(result.status, ExecutionStatus::TimedOut);
    EXPECT_NE(result.stdout_text.find("working..."), std::string::npos);
    EXPECT_NE(harness.terminal.writes().back(), std::string(1, kKillLine));
}

TEST(AdmissionPipelineTest, TimedOutCommandKeepsShellBusyUntilItFinishes) {
    Harness harness;
    harness.terminal.hang_on("sleep 100");
    harness.terminal.script("ls", "a.txt\n");

    const auto slow = harness.pipeline->execute(
        make_request("req-slow", "sleep 100", ExecutionMode::Autonomous,
                     std::chrono::milliseconds(150)));
    EXPECT_EQ(slow.status, ExecutionStatus::TimedOut);
    EXPECT_FALSE(slow.exit_code.has_value());

    const auto writes_before = harness.write_count();
    const auto blocked = harness.pipeline->execute(make_request(
        "req-blocked", "ls", ExecutionMode::Autonomous, std::chrono::milliseconds(150)));
    EXPECT_EQ(blocked.status, ExecutionStatus::TimedOut);
    EXPECT_EQ(blocked.stderr_text, "shell busy");
    EXPECT_EQ(harness.write_count(), writes_before);

    harness.terminal.finish_running(0);
    const auto after = harness.pipeline->execute(make_request("req-after", "ls"));
    EXPECT_EQ(after.status, ExecutionStatus::Completed);
    EXPECT_EQ(after.stdout_text, "a.txt\n");
}

TEST(AdmissionPipelineTest, ConcurrentRequestsAreSerialised) {
    Harness harness;
    constexpr int kCallers = 6;
    for (int i = 0; i < kCallers; ++i) {
        harness.terminal.script("echo " + std::to_string(i), std::to_string(i) + "\n");
    }

    std::vector<ExecutionResult> results(kCallers);
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&harness, &results, i]() {
            results[static_cast<std::size_t>(i)] = harness.pipeline->execute(
                make_request("req-" + std::to_string(i), "echo " + std::to_string(i)));
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    for (int i = 0; i < kCallers; ++i) {
        const auto& result = results[static_cast<std::size_t>(i)];
        EXPECT_EQ(result.status, ExecutionStatus::Completed);
        EXPECT_EQ(result.stdout_text, std::to_string(i) + "\n");
    }
    EXPECT_EQ(harness.write_count(), 1u + kCallers);
}

TEST(AdmissionPipelineTest, ClosedTerminalYieldsError) {
    Harness harness;
    harness.output.close();
    const auto result = harness.pipeline->execute(make_request("req-x", "ls"));
    EXPECT_EQ(result.status, ExecutionStatus::Error);
    EXPECT_EQ(result.stderr_text, "terminal session unavailable");
}

TEST(AdmissionPipelineTest, DeadShellYieldsError) {
    Harness harness;
    harness.terminal.set_alive(false);
    const auto result = harness.pipeline->execute(make_request("req-x", "ls"));
    EXPECT_EQ(result.status, ExecutionStatus::Error);
}

TEST(AdmissionPipelineTest, ShutdownRejectsRequests) {
    Harness harness;
    harness.pipeline->shutdown();
    const auto result = harness.pipeline->execute(make_request("req-x", "ls"));
    EXPECT_EQ(result.status, ExecutionStatus::Error);
    EXPECT_EQ(result.stderr_text, "agent shutting down");
}

TEST(AdmissionPipelineTest, CancelTokenEndsWaitingRequest) {
    Harness harness;
    harness.terminal.hang_on("tail -f log");
    auto cancel = std::make_shared<std::atomic_bool>(false);

    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        *cancel = true;
    });
    const auto result = harness.pipeline->execute(
        make_request("req-tail", "tail -f log", ExecutionMode::Autonomous,
                     std::chrono::seconds(10)),
        cancel);
    canceller.join();

    EXPECT_EQ(result.status, ExecutionStatus::Error);
    EXPECT_EQ(result.stderr_text, "agent shutting down");
    EXPECT_FALSE(harness.pipeline->busy());
}

TEST(AdmissionPipelineTest, PromptRedrawDoesNotCompleteCommand) {
    Harness harness;
    harness.terminal.set_redraw_on_kill(true);
    harness.terminal.script("false", "", 1);
    harness.terminal.script("echo hello", "hello\n");

    const auto failed = harness.pipeline->execute(make_request("req-f", "false"));
    EXPECT_EQ(failed.exit_code.value_or(-1), 1);

    const auto hello = harness.pipeline->execute(make_request("req-h", "echo hello"));
    EXPECT_EQ(hello.status, ExecutionStatus::Completed);
    EXPECT_EQ(hello.exit_code.value_or(-1), 0);
    EXPECT_EQ(hello.stdout_text, "hello\n");
}

TEST(AdmissionPipelineTest, PromptRedrawDoesNotSubmitStagedCommand) {
    Harness harness;
    harness.terminal.set_redraw_on_kill(true);

    const auto started = std::chrono::steady_clock::now();
    const auto result = harness.pipeline->execute(
        make_request("req-rs", "echo staged", ExecutionMode::Review, std::chrono::milliseconds(300)));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.status, ExecutionStatus::TimedOut);
    EXPECT_GE(elapsed, std::chrono::milliseconds(250));
    EXPECT_EQ(harness.terminal.writes().back(), std::string(1, kKillLine));
}

TEST(AdmissionPipelineTest, OperatorEnterAtIdlePromptDoesNotShiftResults) {
    Harness harness;
    harness.terminal.script("false", "", 1);
    harness.terminal.script("echo hello", "hello\n");
    harness.terminal.script("echo world", "world\n");

    EXPECT_EQ(harness.pipeline->execute(make_request("req-f", "false")).exit_code.value_or(-1), 1);
    harness.terminal.press_enter();
    harness.terminal.press_enter();

    const auto hello = harness.pipeline->execute(make_request("req-h", "echo hello"));
    EXPECT_EQ(hello.exit_code.value_or(-1), 0);
    EXPECT_EQ(hello.stdout_text, "hello\n");
    const auto world = harness.pipeline->execute(make_request("req-w", "echo world"));
    EXPECT_EQ(world.stdout_text, "world\n");
}

TEST(AdmissionPipelineTest, MultiLineCommandIsTypedAsOneLine) {
    Harness harness;
    const std::string typed = "eval $'echo one\\necho \\'two\\''";
    harness.terminal.script(typed, "one\ntwo\n");
    harness.terminal.script("pwd", "/srv\n");

    const auto both = harness.pipeline->execute(make_request("req-ml", "echo one\necho 'two'\n"));
    EXPECT_EQ(both.status, ExecutionStatus::Completed);
    EXPECT_EQ(both.stdout_text, "one\ntwo\n");
    EXPECT_EQ(harness.terminal.writes().back(), std::string(1, kKillLine) + typed + "\n");

    const auto next = harness.pipeline->execute(make_request("req-pwd", "pwd"));
    EXPECT_EQ(next.stdout_text, "/srv\n");
}

TEST(AdmissionPipelineTest, ShellLineKeepsSingleLineCommands) {
    EXPECT_EQ(shell_line("ls -l"), "ls -l");
    EXPECT_EQ(shell_line("ls -l\r\n"), "ls -l");
    EXPECT_EQ(shell_line("a\\b\nc"), "eval $'a\\\\b\\nc'");
}

TEST(AdmissionPipelineTest, ApprovedReviewCommandIsStaged) {
    ScriptedOperator human;
    human.answer = ConfirmationDecision{ConfirmationAction::Approve, "", ""};
    Harness harness(human.callback());
    harness.terminal.script("sudo systemctl restart nginx", "");

    std::thread operator_thread([&harness]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        harness.terminal.press_enter();
    });
    const auto result = harness.pipeline->execute(
        make_request("req-rsudo", "sudo systemctl restart nginx", ExecutionMode::Review));
    operator_thread.join();

    EXPECT_EQ(result.status, ExecutionStatus::Completed);
    ASSERT_EQ(human.asked.size(), 1u);
    EXPECT_EQ(harness.terminal.writes().back(),
              std::string(1, kKillLine) + "sudo systemctl restart nginx");
}

TEST(AdmissionPipelineTest, ForegroundJobKeepsShellBusy) {
    Harness harness;
    harness.terminal.hang_on("vim notes.txt");
    harness.terminal.script("ls", "a.txt\n");
    static_cast<void>(harness.terminal.write("vim notes.txt\n"));
    const auto writes_before = harness.write_count();

    const auto blocked = harness.pipeline->execute(make_request(
        "req-b", "ls", ExecutionMode::Autonomous, std::chrono::milliseconds(150)));
    EXPECT_EQ(blocked.status, ExecutionStatus::TimedOut);
    EXPECT_EQ(blocked.stderr_text, "shell busy");
    EXPECT_EQ(harness.write_count(), writes_before);

    harness.terminal.finish_running(0);
    EXPECT_EQ(harness.pipeline->execute(make_request("req-a", "ls")).stdout_text, "a.txt\n");
}

}  // namespace
