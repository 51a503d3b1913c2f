#pragma once

#include <memory>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "ipc/channel.hpp"
#include "protocol/envelope.hpp"
#include "protocol/execution_contract.hpp"

namespace shellgate::ipc {

// Controller side of the channel. One request at a time per client.
class ControllerClient {
public:
    explicit ControllerClient(std::string socket_path);

    core::errors::Result<bool> connect();
    bool connected() const { return channel_ != nullptr; }
    void disconnect();

    // Always yields a result. Transport failures come back as status=error
    // with the diagnostic in stderr, and the connection is dropped so the
    // next call reconnects.
    protocol::ExecutionResult submit_execution(const protocol::ExecutionRequest& request);

    // Sends one envelope and waits for the matching response.
    core::errors::Result<protocol::Envelope> round_trip(const protocol::Envelope& request);

private:
    std::string socket_path_;
    std::unique_ptr<Channel> channel_;
};

}  // namespace shellgate::ipc
