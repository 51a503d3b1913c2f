#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace shellgate::protocol {

namespace message_type {
inline constexpr const char* kExecute = "execute";
inline constexpr const char* kResult = "result";
inline constexpr const char* kError = "error";
inline constexpr const char* kResize = "resize";
inline constexpr const char* kStatus = "status";
inline constexpr const char* kAck = "ack";
}  // namespace message_type

// Wire envelope {id, type, payload}; `id` correlates a response with its request.
struct Envelope {
    std::string id;
    std::string type;
    nlohmann::json payload = nlohmann::json::object();
};

}  // namespace shellgate::protocol
