#include "session/request_tracker.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace shellgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::ExecutionStatus;

std::string to_string(const RequestState state) {
    switch (state) {
        case RequestState::InFlight:
            return "in_flight";
        case RequestState::Completed:
            return "completed";
        case RequestState::Denied:
            return "denied";
        case RequestState::TimedOut:
            return "timed_out";
        case RequestState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

RequestState RequestTracker::state_for(const ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Completed:
            return RequestState::Completed;
        case ExecutionStatus::Denied:
            return RequestState::Denied;
        case ExecutionStatus::TimedOut:
            return RequestState::TimedOut;
        case ExecutionStatus::Error:
        default:
            return RequestState::Failed;
    }
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> RequestTracker::begin(
    const protocol::ExecutionRequest& request) {
    if (request.id.empty()) {
        return GateError{ErrorCategory::Input, "Request id cannot be empty.",
                         "invalid_request_id"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request.id);
    if (it != requests_.end() && it->second.state == RequestState::InFlight) {
        return GateError{ErrorCategory::Input, "duplicate request id",
                         "duplicate_request_id"};
    }

    RequestRecord record;
    record.request = request;
    record.cancel_token = std::make_shared<std::atomic_bool>(false);
    auto token = record.cancel_token;
    requests_[request.id] = std::move(record);
    SHELLGATE_LOG_DEBUG("RequestTracker: " + request.id + " -> in_flight");
    return token;
}

core::errors::Result<RequestState> RequestTracker::finish(const std::string& id,
                                                          const ExecutionStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(id);
    if (it == requests_.end()) {
        return GateError{ErrorCategory::Input, "Request id not found: " + id,
                         "request_not_found"};
    }
    if (it->second.state != RequestState::InFlight) {
        return GateError{ErrorCategory::Internal,
                         "Request already finished as " + to_string(it->second.state),
                         "invalid_state_transition"};
    }

    it->second.state = state_for(status);
    SHELLGATE_LOG_DEBUG("RequestTracker: " + id + " in_flight -> " +
                        to_string(it->second.state));
    finished_order_.push_back(id);
    const RequestState finished = it->second.state;
    prune_finished();
    return finished;
}

void RequestTracker::prune_finished() {
    while (finished_order_.size() > kMaxFinishedRecords) {
        const std::string oldest = finished_order_.front();
        finished_order_.pop_front();
        auto it = requests_.find(oldest);
        // The id may have been reused by a request that is in flight again.
        if (it != requests_.end() && it->second.state != RequestState::InFlight) {
            requests_.erase(it);
        }
    }
}

core::errors::Result<RequestState> RequestTracker::get_state(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(id);
    if (it == requests_.end()) {
        return GateError{ErrorCategory::Input, "Request id not found: " + id,
                         "request_not_found"};
    }
    return it->second.state;
}

std::size_t RequestTracker::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t raised = 0;
    for (auto& [id, record] : requests_) {
        if (record.state == RequestState::InFlight) {
            *record.cancel_token = true;
            ++raised;
        }
    }
    return raised;
}

std::size_t RequestTracker::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, record] : requests_) {
        if (record.state == RequestState::InFlight) {
            ++count;
        }
    }
    return count;
}

}  // namespace shellgate::session
