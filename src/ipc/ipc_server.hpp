#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "ipc/channel.hpp"
#include "protocol/envelope.hpp"

namespace shellgate::ipc {

// Produces exactly one response envelope per request. May block for as long
// as the request takes; only the calling connection's thread waits.
using RequestHandler = std::function<protocol::Envelope(const protocol::Envelope&)>;

class IpcServer {
public:
    IpcServer(std::string socket_path, RequestHandler handler);
    ~IpcServer();

    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    // Binds and starts the accept thread. A stale socket file left by a
    // dead agent is replaced; a live one is reported as "socket_in_use".
    core::errors::Result<bool> start();

    // Closes the listener and every connection, joins all threads and
    // removes the socket file. Idempotent.
    void stop();

    const std::string& socket_path() const { return socket_path_; }
    std::size_t connection_count() const;

private:
    struct Connection {
        std::shared_ptr<Channel> channel;
        std::thread worker;
        std::shared_ptr<std::atomic_bool> finished;
    };

    core::errors::Result<bool> prepare_socket_path() const;
    void accept_loop();
    void serve(std::shared_ptr<Channel> channel, std::shared_ptr<std::atomic_bool> finished);
    void reap_finished();

    std::string socket_path_;
    RequestHandler handler_;
    int listen_fd_ = -1;
    std::atomic_bool running_{false};
    std::thread accept_thread_;
    mutable std::mutex connections_mutex_;
    std::vector<Connection> connections_;
};

}  // namespace shellgate::ipc
