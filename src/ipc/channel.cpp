#include "ipc/channel.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include "protocol/message_codec.hpp"

namespace shellgate::ipc {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

GateError channel_closed(const std::string& message) {
    return GateError{ErrorCategory::Transport, message, "channel_closed"};
}

}  // namespace

std::string encode_frame(const std::string& body) {
    const auto length = static_cast<std::uint32_t>(body.size());
    std::string frame;
    frame.reserve(body.size() + 4);
    frame.push_back(static_cast<char>((length >> 24) & 0xff));
    frame.push_back(static_cast<char>((length >> 16) & 0xff));
    frame.push_back(static_cast<char>((length >> 8) & 0xff));
    frame.push_back(static_cast<char>(length & 0xff));
    frame += body;
    return frame;
}

Channel::Channel(const int fd) : fd_(fd) {}

Channel::~Channel() {
    close_fd();
}

Channel::Channel(Channel&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Channel& Channel::operator=(Channel&& other) noexcept {
    if (this != &other) {
        close_fd();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void Channel::close_fd() {
    if (fd_ >= 0) {
        static_cast<void>(::close(fd_));
        fd_ = -1;
    }
}

core::errors::Result<Channel> Channel::connect(const std::string& socket_path) {
    sockaddr_un addr{};
    if (socket_path.empty() || socket_path.size() >= sizeof(addr.sun_path)) {
        return GateError{ErrorCategory::Input,
                         "Invalid socket path: '" + socket_path + "'",
                         "invalid_socket_path"};
    }

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return GateError{ErrorCategory::Internal,
                         std::string("socket() failed: ") + std::strerror(errno),
                         "socket_failed"};
    }

    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, socket_path.c_str(), socket_path.size() + 1);
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        const int err = errno;
        static_cast<void>(::close(fd));
        if (err == ECONNREFUSED || err == ENOENT) {
            return GateError{ErrorCategory::Transport,
                             "No agent is listening on " + socket_path,
                             "connection_refused",
                             "Start the agent with `shellgate agent`."};
        }
        return GateError{ErrorCategory::Transport,
                         "Failed to connect to " + socket_path + ": " + std::strerror(err),
                         "connection_failed"};
    }
    return Channel(fd);
}

core::errors::Result<bool> Channel::write_all(const char* data, const std::size_t size) {
    std::size_t sent = 0;
    while (sent < size) {
        const ssize_t n = ::send(fd_, data + sent, size - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return channel_closed(std::string("Send failed: ") +
                              (n < 0 ? std::strerror(errno) : "connection closed"));
    }
    return true;
}

core::errors::Result<bool> Channel::read_exact(char* data, const std::size_t size) {
    std::size_t received = 0;
    while (received < size) {
        const ssize_t n = ::recv(fd_, data + received, size - received, 0);
        if (n > 0) {
            received += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n == 0) {
            return channel_closed("Connection closed by peer.");
        }
        return channel_closed(std::string("Receive failed: ") + std::strerror(errno));
    }
    return true;
}

core::errors::Result<bool> Channel::send(const protocol::Envelope& envelope) {
    if (fd_ < 0) {
        return channel_closed("Channel is not connected.");
    }
    const std::string body = protocol::encode_envelope(envelope);
    if (body.size() > kMaxFrameBytes) {
        return GateError{ErrorCategory::Input, "Message exceeds the frame size limit.",
                         "frame_too_large"};
    }
    const std::string frame = encode_frame(body);
    return write_all(frame.data(), frame.size());
}

core::errors::Result<protocol::Envelope> Channel::receive() {
    if (fd_ < 0) {
        return channel_closed("Channel is not connected.");
    }

    unsigned char header[4];
    auto status = read_exact(reinterpret_cast<char*>(header), sizeof(header));
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    const std::uint32_t length = (static_cast<std::uint32_t>(header[0]) << 24) |
                                 (static_cast<std::uint32_t>(header[1]) << 16) |
                                 (static_cast<std::uint32_t>(header[2]) << 8) |
                                 static_cast<std::uint32_t>(header[3]);
    if (length > kMaxFrameBytes) {
        // The stream cannot be resynchronised after an oversized header.
        return channel_closed("Peer announced a frame of " + std::to_string(length) +
                              " bytes.");
    }

    std::string body(length, '\0');
    if (length > 0) {
        status = read_exact(body.data(), body.size());
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }
    return protocol::decode_envelope(body);
}

void Channel::shutdown() {
    if (fd_ >= 0) {
        static_cast<void>(::shutdown(fd_, SHUT_RDWR));
    }
}

core::errors::Result<Channel> connect_with_backoff(const std::string& socket_path,
                                                   const int attempts,
                                                   const std::chrono::milliseconds initial_delay) {
    auto delay = initial_delay;
    GateError last_error{ErrorCategory::Transport, "No connection attempt was made.",
                         "connection_refused"};
    for (int attempt = 0; attempt < std::max(attempts, 1); ++attempt) {
        auto channel = Channel::connect(socket_path);
        if (!core::errors::is_error(channel)) {
            return channel;
        }
        last_error = core::errors::get_error(channel);
        if (last_error.category != ErrorCategory::Transport) {
            break;
        }
        if (attempt + 1 < attempts) {
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }
    return last_error;
}

}  // namespace shellgate::ipc
