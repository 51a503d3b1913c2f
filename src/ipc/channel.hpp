#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "protocol/envelope.hpp"

namespace shellgate::ipc {

// Frames are a 4-byte big-endian length followed by a UTF-8 JSON body.
inline constexpr std::uint32_t kMaxFrameBytes = 16 * 1024 * 1024;

std::string encode_frame(const std::string& body);

// One connected Unix domain socket. Move-only; closes on destruction.
class Channel {
public:
    explicit Channel(int fd);
    ~Channel();

    Channel(Channel&& other) noexcept;
    Channel& operator=(Channel&& other) noexcept;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Fails with code "connection_refused" when nothing listens on the path.
    static core::errors::Result<Channel> connect(const std::string& socket_path);

    core::errors::Result<bool> send(const protocol::Envelope& envelope);

    // Transport failures carry code "channel_closed". A frame whose body is
    // not a valid envelope is an Input error; the stream stays usable.
    core::errors::Result<protocol::Envelope> receive();

    // Unblocks a receive() running on another thread.
    void shutdown();
    bool is_open() const { return fd_ >= 0; }

private:
    core::errors::Result<bool> write_all(const char* data, std::size_t size);
    core::errors::Result<bool> read_exact(char* data, std::size_t size);
    void close_fd();

    int fd_ = -1;
};

// Retries connect() with doubling delays; the last error is returned.
core::errors::Result<Channel> connect_with_backoff(const std::string& socket_path,
                                                   int attempts,
                                                   std::chrono::milliseconds initial_delay);

}  // namespace shellgate::ipc
