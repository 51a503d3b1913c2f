#include "protocol/message_codec.hpp"

#include <cmath>
#include <cstdint>
#include <utility>
#include "core/config/request_id.hpp"

namespace shellgate::protocol {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;

namespace {

constexpr double kMaxTimeoutSeconds = 24.0 * 60.0 * 60.0;

GateError input_error(const std::string& message, const std::string& code) {
    return GateError{ErrorCategory::Input, message, code};
}

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}  // namespace

core::errors::Result<Envelope> decode_envelope(const std::string& body) {
    const json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return input_error("Message body is not valid JSON.", "malformed_json");
    }
    if (!parsed.is_object()) {
        return input_error("Message must be a JSON object.", "malformed_envelope");
    }

    const auto type_it = parsed.find("type");
    if (type_it == parsed.end() || !type_it->is_string()) {
        return input_error("Message is missing a string 'type'.", "malformed_envelope");
    }

    const auto id_it = parsed.find("id");
    if (id_it != parsed.end() && !id_it->is_null() && !id_it->is_string()) {
        return input_error("Message 'id' must be a string.", "malformed_envelope");
    }

    Envelope envelope;
    envelope.type = type_it->get<std::string>();
    envelope.id = string_field(parsed, "id");

    const auto payload_it = parsed.find("payload");
    if (payload_it != parsed.end() && !payload_it->is_null()) {
        if (!payload_it->is_object()) {
            return input_error("Message 'payload' must be an object.",
                               "malformed_envelope");
        }
        envelope.payload = *payload_it;
    }
    return envelope;
}

std::string encode_envelope(const Envelope& envelope) {
    json message;
    message["id"] = envelope.id;
    message["type"] = envelope.type;
    message["payload"] = envelope.payload;
    // Terminal output is not guaranteed to be valid UTF-8.
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<ExecutionRequest> request_from_envelope(
    const Envelope& envelope, const std::chrono::milliseconds default_timeout) {
    if (envelope.type != message_type::kExecute) {
        return input_error("Envelope is not an execute request: " + envelope.type,
                           "unexpected_type");
    }

    const json& payload = envelope.payload;
    const auto command_it = payload.find("command");
    if (command_it == payload.end() || !command_it->is_string()) {
        return input_error("Execute payload requires a string 'command'.",
                           "missing_command");
    }

    ExecutionRequest request;
    request.id = envelope.id.empty() ? core::config::generate_request_id()
                                     : envelope.id;
    request.command = command_it->get<std::string>();
    request.timeout = default_timeout;

    const auto mode_it = payload.find("mode");
    if (mode_it != payload.end() && !mode_it->is_null()) {
        if (!mode_it->is_string()) {
            return input_error("Execute 'mode' must be a string.", "invalid_mode");
        }
        const auto mode = parse_mode(mode_it->get<std::string>());
        if (!mode.has_value()) {
            return GateError{ErrorCategory::Input,
                             "Unknown execution mode: " + mode_it->get<std::string>(),
                             "invalid_mode",
                             "Use autonomous, review or tutor."};
        }
        request.mode = mode.value();
    }

    const auto timeout_it = payload.find("timeout");
    if (timeout_it != payload.end() && !timeout_it->is_null()) {
        if (!timeout_it->is_number()) {
            return input_error("Execute 'timeout' must be a number of seconds.",
                               "invalid_timeout");
        }
        const double seconds = timeout_it->get<double>();
        if (!std::isfinite(seconds) || seconds <= 0.0 || seconds > kMaxTimeoutSeconds) {
            return input_error("Execute 'timeout' must be between 0 and 86400 seconds.",
                               "invalid_timeout");
        }
        request.timeout = std::chrono::milliseconds(
            static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
        if (request.timeout.count() == 0) {
            request.timeout = std::chrono::milliseconds(1);
        }
    }

    return request;
}

Envelope request_to_envelope(const ExecutionRequest& request) {
    Envelope envelope;
    envelope.id = request.id;
    envelope.type = message_type::kExecute;
    envelope.payload["command"] = request.command;
    envelope.payload["mode"] = to_string(request.mode);
    envelope.payload["timeout"] =
        static_cast<double>(request.timeout.count()) / 1000.0;
    return envelope;
}

Envelope result_to_envelope(const ExecutionResult& result) {
    Envelope envelope;
    envelope.id = result.id;
    envelope.type = message_type::kResult;
    envelope.payload["stdout"] = result.stdout_text;
    envelope.payload["stderr"] = result.stderr_text;
    envelope.payload["exit_code"] =
        result.exit_code.has_value() ? json(result.exit_code.value()) : json(nullptr);
    envelope.payload["status"] = to_string(result.status);
    return envelope;
}

core::errors::Result<ExecutionResult> result_from_envelope(const Envelope& envelope) {
    if (envelope.type == message_type::kError) {
        const std::string message = string_field(envelope.payload, "message");
        const std::string code = string_field(envelope.payload, "code");
        return make_result(envelope.id, ExecutionStatus::Error,
                           code.empty() ? message : code + ": " + message);
    }
    if (envelope.type != message_type::kResult) {
        return input_error("Envelope is not a result: " + envelope.type,
                           "unexpected_type");
    }

    const json& payload = envelope.payload;
    const auto status = parse_status(string_field(payload, "status"));
    if (!status.has_value()) {
        return input_error("Result payload has no valid 'status'.", "invalid_status");
    }

    ExecutionResult result;
    result.id = envelope.id;
    result.status = status.value();
    result.stdout_text = string_field(payload, "stdout");
    result.stderr_text = string_field(payload, "stderr");
    const auto exit_it = payload.find("exit_code");
    if (exit_it != payload.end() && exit_it->is_number_integer()) {
        result.exit_code = exit_it->get<int>();
    }
    return result;
}

Envelope error_envelope(const std::string& id, const GateError& error) {
    Envelope envelope;
    envelope.id = id;
    envelope.type = message_type::kError;
    envelope.payload["message"] = error.message;
    envelope.payload["code"] = error.code;
    return envelope;
}

}  // namespace shellgate::protocol
