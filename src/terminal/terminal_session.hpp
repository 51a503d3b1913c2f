#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>
#include "core/errors/gate_errors.hpp"

namespace shellgate::terminal {

// The write side of the shell as the admission pipeline sees it.
class TerminalPort {
public:
    virtual ~TerminalPort() = default;

    virtual core::errors::Result<std::size_t> write(const std::string& bytes) = 0;
    virtual bool is_alive() = 0;
    // True when no foreground job is running, i.e. the shell owns the terminal.
    virtual bool is_idle() const = 0;
};

struct SpawnOptions {
    std::string shell_path = "/bin/bash";
    std::vector<std::string> args = {"-i"};
    std::vector<std::pair<std::string, std::string>> environment = {{"TERM", "xterm"}};
    unsigned short rows = 24;
    unsigned short cols = 160;
};

class TerminalSession : public TerminalPort {
    struct PrivateTag {};

public:
    // Use spawn(); the tag keeps construction inside this class.
    TerminalSession(PrivateTag, int master_fd, pid_t pid);

    static core::errors::Result<std::unique_ptr<TerminalSession>> spawn(
        const SpawnOptions& options);

    ~TerminalSession() override;
    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    core::errors::Result<std::size_t> write(const std::string& bytes) override;

    // Returns what the shell produced since the last read. Blocks up to
    // `deadline`; an empty string means nothing arrived in time.
    core::errors::Result<std::string> read_available(std::chrono::milliseconds deadline);

    bool is_alive() override;
    bool is_idle() const override;

    core::errors::Result<bool> resize(unsigned short rows, unsigned short cols);
    std::optional<std::filesystem::path> current_working_directory() const;
    std::optional<int> exit_status() const;
    pid_t pid() const { return pid_; }

    // SIGHUP, then SIGKILL if the shell ignores it. Idempotent.
    void terminate();

private:
    void record_exit(int status);

    int master_fd_ = -1;
    pid_t pid_ = -1;
    std::mutex write_mutex_;
    mutable std::mutex state_mutex_;
    bool exited_ = false;
    std::optional<int> exit_status_;
};

}  // namespace shellgate::terminal
