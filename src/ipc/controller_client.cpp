#include "ipc/controller_client.hpp"

#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/message_codec.hpp"

namespace shellgate::ipc {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::ExecutionResult;
using protocol::ExecutionStatus;

ControllerClient::ControllerClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

core::errors::Result<bool> ControllerClient::connect() {
    if (channel_) {
        return true;
    }
    auto channel = Channel::connect(socket_path_);
    if (core::errors::is_error(channel)) {
        return core::errors::get_error(channel);
    }
    channel_ = std::make_unique<Channel>(core::errors::take_value(channel));
    return true;
}

void ControllerClient::disconnect() {
    channel_.reset();
}

core::errors::Result<protocol::Envelope> ControllerClient::round_trip(
    const protocol::Envelope& request) {
    auto connected_result = connect();
    if (core::errors::is_error(connected_result)) {
        return core::errors::get_error(connected_result);
    }

    auto sent = channel_->send(request);
    if (core::errors::is_error(sent)) {
        disconnect();
        return core::errors::get_error(sent);
    }

    auto received = channel_->receive();
    if (core::errors::is_error(received)) {
        const auto error = core::errors::get_error(received);
        if (error.category == ErrorCategory::Transport) {
            disconnect();
        }
        return error;
    }

    auto response = core::errors::take_value(received);
    if (!response.id.empty() && !request.id.empty() && response.id != request.id) {
        disconnect();
        return GateError{ErrorCategory::Transport,
                         "Response id '" + response.id + "' does not match request '" +
                             request.id + "'",
                         "channel_closed"};
    }
    return response;
}

ExecutionResult ControllerClient::submit_execution(const protocol::ExecutionRequest& request) {
    protocol::ExecutionRequest outgoing = request;
    if (outgoing.id.empty()) {
        outgoing.id = core::config::generate_request_id();
    }

    auto response = round_trip(protocol::request_to_envelope(outgoing));
    if (core::errors::is_error(response)) {
        const auto& error = core::errors::get_error(response);
        SHELLGATE_LOG_WARN("ControllerClient: request " + outgoing.id + " failed: " +
                           error.message);
        return protocol::make_result(outgoing.id, ExecutionStatus::Error,
                                     error.code + ": " + error.message);
    }

    auto result = protocol::result_from_envelope(core::errors::get_value(response));
    if (core::errors::is_error(result)) {
        const auto& error = core::errors::get_error(result);
        return protocol::make_result(outgoing.id, ExecutionStatus::Error,
                                     error.code + ": " + error.message);
    }
    auto value = core::errors::take_value(result);
    if (value.id.empty()) {
        value.id = outgoing.id;
    }
    return value;
}

}  // namespace shellgate::ipc
