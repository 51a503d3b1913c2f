#include "terminal/terminal_session.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace shellgate::terminal {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr auto kHangupGrace = std::chrono::milliseconds(500);

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

[[noreturn]] void exec_shell(const SpawnOptions& options, const int status_fd) {
    for (const auto& [name, value] : options.environment) {
        static_cast<void>(setenv(name.c_str(), value.c_str(), 1));
    }

    std::vector<char*> argv;
    argv.reserve(options.args.size() + 2);
    argv.push_back(const_cast<char*>(options.shell_path.c_str()));
    for (const auto& arg : options.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    execvp(options.shell_path.c_str(), argv.data());

    // Only reached when exec failed; report errno through the CLOEXEC pipe.
    const int err = errno;
    static_cast<void>(::write(status_fd, &err, sizeof(err)));
    _exit(127);
}

}  // namespace

TerminalSession::TerminalSession(PrivateTag, const int master_fd, const pid_t pid)
    : master_fd_(master_fd), pid_(pid) {}

TerminalSession::~TerminalSession() {
    terminate();
}

core::errors::Result<std::unique_ptr<TerminalSession>> TerminalSession::spawn(
    const SpawnOptions& options) {
    if (options.shell_path.empty()) {
        return GateError{ErrorCategory::Spawn, "Shell path cannot be empty.",
                         "spawn_failed"};
    }

    int status_pipe[2] = {-1, -1};
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        return GateError{ErrorCategory::Internal, "Failed to create spawn status pipe.",
                         "pipe_creation_failed"};
    }

    winsize size{};
    size.ws_row = options.rows;
    size.ws_col = options.cols;

    int master_fd = -1;
    const pid_t pid = forkpty(&master_fd, nullptr, nullptr, &size);
    if (pid < 0) {
        const int err = errno;
        static_cast<void>(close(status_pipe[0]));
        static_cast<void>(close(status_pipe[1]));
        return GateError{ErrorCategory::Spawn,
                         std::string("forkpty failed: ") + std::strerror(err),
                         "spawn_failed"};
    }

    if (pid == 0) {
        static_cast<void>(close(status_pipe[0]));
        exec_shell(options, status_pipe[1]);
    }

    static_cast<void>(close(status_pipe[1]));
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    static_cast<void>(close(status_pipe[0]));

    if (n > 0) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        static_cast<void>(close(master_fd));
        return GateError{ErrorCategory::Spawn,
                         "Failed to start shell " + options.shell_path + ": " +
                             std::strerror(child_errno),
                         "spawn_failed",
                         "Check shell.path in the configuration."};
    }

    set_nonblocking(master_fd);
    SHELLGATE_LOG_INFO("TerminalSession: started " + options.shell_path + " with PID " +
                       std::to_string(pid));
    return std::make_unique<TerminalSession>(PrivateTag{}, master_fd, pid);
}

core::errors::Result<std::size_t> TerminalSession::write(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (master_fd_ < 0) {
        return GateError{ErrorCategory::Transport, "Terminal session is closed.",
                         "session_closed"};
    }

    std::size_t written = 0;
    while (written < bytes.size()) {
        const ssize_t n = ::write(master_fd_, bytes.data() + written, bytes.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{master_fd_, POLLOUT, 0};
            static_cast<void>(poll(&pfd, 1, 50));
            continue;
        }
        return GateError{ErrorCategory::Transport,
                         std::string("Write to terminal failed: ") + std::strerror(errno),
                         "session_write_failed"};
    }
    return written;
}

core::errors::Result<std::string> TerminalSession::read_available(
    const std::chrono::milliseconds deadline) {
    if (master_fd_ < 0) {
        return GateError{ErrorCategory::Transport, "Terminal session is closed.",
                         "session_closed"};
    }

    pollfd pfd{master_fd_, POLLIN, 0};
    const int ready = poll(&pfd, 1, static_cast<int>(deadline.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return std::string();
        }
        return GateError{ErrorCategory::Internal,
                         std::string("poll on terminal failed: ") + std::strerror(errno),
                         "session_poll_failed"};
    }
    if (ready == 0) {
        return std::string();
    }

    std::string out;
    char buffer[kReadChunk];
    while (true) {
        const ssize_t n = read(master_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return out;
        }
        // EIO (Linux) or EOF once the slave side is gone.
        if (!out.empty()) {
            return out;
        }
        return GateError{ErrorCategory::Transport, "Shell closed the terminal.",
                         "session_closed"};
    }
}

void TerminalSession::record_exit(const int status) {
    exited_ = true;
    if (WIFEXITED(status)) {
        exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status_ = 128 + WTERMSIG(status);
    } else {
        exit_status_ = -1;
    }
}

bool TerminalSession::is_alive() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (exited_ || pid_ <= 0) {
        return false;
    }
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        record_exit(status);
        SHELLGATE_LOG_WARN("TerminalSession: shell " + std::to_string(pid_) +
                           " exited with status " + std::to_string(*exit_status_));
        return false;
    }
    if (waited < 0 && errno == ECHILD) {
        exited_ = true;
        return false;
    }
    return true;
}

bool TerminalSession::is_idle() const {
    if (master_fd_ < 0) {
        return false;
    }
    const pid_t foreground = tcgetpgrp(master_fd_);
    return foreground >= 0 && foreground == getpgid(pid_);
}

core::errors::Result<bool> TerminalSession::resize(const unsigned short rows,
                                                   const unsigned short cols) {
    if (rows == 0 || cols == 0) {
        return GateError{ErrorCategory::Input, "Terminal size must be non-zero.",
                         "invalid_size"};
    }
    winsize size{};
    size.ws_row = rows;
    size.ws_col = cols;
    if (ioctl(master_fd_, TIOCSWINSZ, &size) != 0) {
        return GateError{ErrorCategory::Internal,
                         std::string("Failed to resize terminal: ") + std::strerror(errno),
                         "resize_failed"};
    }
    return true;
}

std::optional<std::filesystem::path> TerminalSession::current_working_directory() const {
    std::error_code ec;
    const auto link = std::filesystem::path("/proc") / std::to_string(pid_) / "cwd";
    auto target = std::filesystem::read_symlink(link, ec);
    if (ec) {
        return std::nullopt;
    }
    return target;
}

std::optional<int> TerminalSession::exit_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_status_;
}

void TerminalSession::terminate() {
    if (is_alive()) {
        static_cast<void>(kill(pid_, SIGHUP));
        const auto give_up = std::chrono::steady_clock::now() + kHangupGrace;
        while (is_alive() && std::chrono::steady_clock::now() < give_up) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (is_alive()) {
            static_cast<void>(kill(pid_, SIGKILL));
            int status = 0;
            static_cast<void>(waitpid(pid_, &status, 0));
            std::lock_guard<std::mutex> lock(state_mutex_);
            record_exit(status);
        }
        SHELLGATE_LOG_INFO("TerminalSession: stopped shell process " + std::to_string(pid_));
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (master_fd_ >= 0) {
        static_cast<void>(close(master_fd_));
        master_fd_ = -1;
    }
}

}  // namespace shellgate::terminal
