#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/gate_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace shellgate::session {

enum class RequestState {
    InFlight,
    Completed,
    Denied,
    TimedOut,
    Failed
};

std::string to_string(RequestState state);

struct RequestRecord {
    protocol::ExecutionRequest request;
    RequestState state = RequestState::InFlight;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Tracks requests between admission and their single result.
class RequestTracker {
public:
    // Fails with "duplicate_request_id" while a request with the same id is
    // still in flight. Finished ids may be reused.
    core::errors::Result<std::shared_ptr<std::atomic_bool>> begin(
        const protocol::ExecutionRequest& request);

    // Exactly one transition out of InFlight is accepted per request.
    core::errors::Result<RequestState> finish(const std::string& id,
                                              protocol::ExecutionStatus status);

    core::errors::Result<RequestState> get_state(const std::string& id) const;

    // Raises every in-flight cancel token; returns how many were raised.
    std::size_t cancel_all();

    std::size_t in_flight_count() const;

private:
    static constexpr std::size_t kMaxFinishedRecords = 1024;

    static RequestState state_for(protocol::ExecutionStatus status);
    void prune_finished();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestRecord> requests_;
    std::deque<std::string> finished_order_;
};

}  // namespace shellgate::session
