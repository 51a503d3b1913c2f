#include "ipc/ipc_server.hpp"

#include <cerrno>
#include <cstring>
#include <utility>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "protocol/message_codec.hpp"

namespace shellgate::ipc {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

constexpr int kListenBacklog = 16;

}  // namespace

IpcServer::IpcServer(std::string socket_path, RequestHandler handler)
    : socket_path_(std::move(socket_path)), handler_(std::move(handler)) {}

IpcServer::~IpcServer() {
    stop();
}

core::errors::Result<bool> IpcServer::prepare_socket_path() const {
    struct stat info {};
    if (lstat(socket_path_.c_str(), &info) != 0) {
        return true;
    }
    if (!S_ISSOCK(info.st_mode)) {
        return GateError{ErrorCategory::Input,
                         "Refusing to replace non-socket file at " + socket_path_,
                         "socket_path_occupied"};
    }

    auto listener = Channel::connect(socket_path_);
    if (!core::errors::is_error(listener)) {
        return GateError{ErrorCategory::Transport,
                         "Another agent is already listening on " + socket_path_,
                         "socket_in_use"};
    }

    SHELLGATE_LOG_INFO("IpcServer: removing stale socket " + socket_path_);
    if (unlink(socket_path_.c_str()) != 0 && errno != ENOENT) {
        return GateError{ErrorCategory::Internal,
                         "Failed to remove stale socket " + socket_path_ + ": " +
                             std::strerror(errno),
                         "socket_unlink_failed"};
    }
    return true;
}

core::errors::Result<bool> IpcServer::start() {
    if (running_) {
        return true;
    }

    sockaddr_un addr{};
    if (socket_path_.empty() || socket_path_.size() >= sizeof(addr.sun_path)) {
        return GateError{ErrorCategory::Input, "Invalid socket path: '" + socket_path_ + "'",
                         "invalid_socket_path"};
    }

    auto prepared = prepare_socket_path();
    if (core::errors::is_error(prepared)) {
        return core::errors::get_error(prepared);
    }

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return GateError{ErrorCategory::Internal,
                         std::string("socket() failed: ") + std::strerror(errno),
                         "socket_failed"};
    }

    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, socket_path_.c_str(), socket_path_.size() + 1);

    const mode_t previous_mask = umask(0077);
    const int bound = ::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    const int bind_errno = errno;
    umask(previous_mask);
    if (bound != 0) {
        static_cast<void>(::close(fd));
        return GateError{ErrorCategory::Transport,
                         "Failed to bind " + socket_path_ + ": " + std::strerror(bind_errno),
                         "bind_failed"};
    }
    if (chmod(socket_path_.c_str(), 0600) != 0) {
        SHELLGATE_LOG_WARN("IpcServer: chmod 0600 failed on " + socket_path_);
    }
    if (::listen(fd, kListenBacklog) != 0) {
        const int err = errno;
        static_cast<void>(::close(fd));
        static_cast<void>(unlink(socket_path_.c_str()));
        return GateError{ErrorCategory::Transport,
                         "Failed to listen on " + socket_path_ + ": " + std::strerror(err),
                         "listen_failed"};
    }

    listen_fd_ = fd;
    running_ = true;
    accept_thread_ = std::thread(&IpcServer::accept_loop, this);
    SHELLGATE_LOG_INFO("IpcServer: listening on " + socket_path_);
    return true;
}

void IpcServer::accept_loop() {
    while (running_) {
        const int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            if (running_) {
                SHELLGATE_LOG_ERROR(std::string("IpcServer: accept failed: ") +
                                    std::strerror(errno));
            }
            break;
        }

        reap_finished();

        auto channel = std::make_shared<Channel>(client_fd);
        auto finished = std::make_shared<std::atomic_bool>(false);
        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (!running_) {
            break;
        }
        connections_.push_back(Connection{
            channel, std::thread(&IpcServer::serve, this, channel, finished), finished});
        SHELLGATE_LOG_DEBUG("IpcServer: accepted connection (" +
                            std::to_string(connections_.size()) + " open)");
    }
}

void IpcServer::serve(std::shared_ptr<Channel> channel,
                      std::shared_ptr<std::atomic_bool> finished) {
    while (running_) {
        auto received = channel->receive();
        if (core::errors::is_error(received)) {
            const auto& error = core::errors::get_error(received);
            if (error.category == ErrorCategory::Transport) {
                SHELLGATE_LOG_DEBUG("IpcServer: connection ended: " + error.message);
                break;
            }
            // Undecodable frame: report it and keep the connection.
            SHELLGATE_LOG_WARN("IpcServer: rejected frame: " + error.message);
            auto sent = channel->send(protocol::error_envelope("", error));
            if (core::errors::is_error(sent)) {
                break;
            }
            continue;
        }

        const auto& request = core::errors::get_value(received);
        const protocol::Envelope response = handler_(request);
        auto sent = channel->send(response);
        if (core::errors::is_error(sent)) {
            SHELLGATE_LOG_WARN("IpcServer: response for '" + request.id +
                               "' could not be delivered: " +
                               core::errors::get_error(sent).message);
            break;
        }
    }
    channel->shutdown();
    *finished = true;
}

void IpcServer::reap_finished() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (it->finished->load()) {
            if (it->worker.joinable()) {
                it->worker.join();
            }
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t IpcServer::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    std::size_t open = 0;
    for (const auto& connection : connections_) {
        if (!connection.finished->load()) {
            ++open;
        }
    }
    return open;
}

void IpcServer::stop() {
    const bool was_running = running_.exchange(false);
    if (listen_fd_ >= 0) {
        static_cast<void>(::shutdown(listen_fd_, SHUT_RDWR));
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        static_cast<void>(::close(listen_fd_));
        listen_fd_ = -1;
    }

    std::vector<Connection> connections;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections.swap(connections_);
    }
    for (auto& connection : connections) {
        connection.channel->shutdown();
    }
    for (auto& connection : connections) {
        if (connection.worker.joinable()) {
            connection.worker.join();
        }
    }

    if (was_running) {
        static_cast<void>(unlink(socket_path_.c_str()));
        SHELLGATE_LOG_INFO("IpcServer: stopped listening on " + socket_path_);
    }
}

}  // namespace shellgate::ipc
