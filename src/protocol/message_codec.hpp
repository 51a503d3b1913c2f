#pragma once

#include <chrono>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "protocol/envelope.hpp"
#include "protocol/execution_contract.hpp"

namespace shellgate::protocol {

core::errors::Result<Envelope> decode_envelope(const std::string& body);

std::string encode_envelope(const Envelope& envelope);

core::errors::Result<ExecutionRequest> request_from_envelope(
    const Envelope& envelope, std::chrono::milliseconds default_timeout);

Envelope request_to_envelope(const ExecutionRequest& request);

Envelope result_to_envelope(const ExecutionResult& result);

// Accepts both `result` and `error` envelopes; an `error` envelope becomes a
// result with status=error so the controller always sees one outcome.
core::errors::Result<ExecutionResult> result_from_envelope(const Envelope& envelope);

Envelope error_envelope(const std::string& id, const core::errors::GateError& error);

}  // namespace shellgate::protocol
