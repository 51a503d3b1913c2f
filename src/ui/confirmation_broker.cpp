#include "ui/confirmation_broker.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace shellgate::ui {

using core::errors::ErrorCategory;
using core::errors::GateError;
using runtime::ConfirmationAction;
using runtime::ConfirmationDecision;

std::string to_string(const SurfaceState state) {
    switch (state) {
        case SurfaceState::Idle:
            return "idle";
        case SurfaceState::Streaming:
            return "streaming";
        case SurfaceState::AwaitingConfirmation:
            return "awaiting_confirmation";
        case SurfaceState::Resolved:
            return "resolved";
        default:
            return "unknown";
    }
}

void ConfirmationBroker::start_streaming() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SurfaceState::Idle) {
        state_ = pending_.empty() ? SurfaceState::Streaming : SurfaceState::AwaitingConfirmation;
    }
}

core::errors::Result<std::future<ConfirmationDecision>> ConfirmationBroker::submit(
    const protocol::ExecutionRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return GateError{ErrorCategory::Cancelled, "Confirmation surface is closed.",
                         "surface_closed"};
    }
    const bool duplicate = std::any_of(pending_.begin(), pending_.end(),
                                       [&request](const Entry& entry) {
                                           return entry.info.id == request.id;
                                       });
    if (duplicate) {
        return GateError{ErrorCategory::Input,
                         "A confirmation is already pending for " + request.id,
                         "duplicate_request_id"};
    }

    Entry entry;
    entry.info.id = request.id;
    entry.info.command = request.command;
    entry.info.mode = request.mode;
    entry.info.submitted_at = std::chrono::steady_clock::now();
    auto future = entry.promise.get_future();
    pending_.push_back(std::move(entry));
    state_ = SurfaceState::AwaitingConfirmation;
    SHELLGATE_LOG_INFO("ConfirmationBroker: awaiting operator for " + request.id + " (" +
                       std::to_string(pending_.size()) + " pending)");
    return future;
}

bool ConfirmationBroker::resolve(const std::string& id, const ConfirmationDecision& decision) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&id](const Entry& entry) { return entry.info.id == id; });
    if (it == pending_.end()) {
        return false;
    }
    it->promise.set_value(decision);
    pending_.erase(it);
    state_ = SurfaceState::Resolved;
    return true;
}

bool ConfirmationBroker::withdraw(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&id](const Entry& entry) { return entry.info.id == id; });
    if (it == pending_.end()) {
        return false;
    }
    pending_.erase(it);
    if (pending_.empty() && state_ == SurfaceState::AwaitingConfirmation) {
        state_ = SurfaceState::Streaming;
    }
    SHELLGATE_LOG_INFO("ConfirmationBroker: withdrew prompt for " + id);
    return true;
}

void ConfirmationBroker::acknowledge() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SurfaceState::Resolved && !closed_) {
        state_ = pending_.empty() ? SurfaceState::Streaming : SurfaceState::AwaitingConfirmation;
    }
}

std::size_t ConfirmationBroker::cancel_all(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    const std::size_t cancelled = pending_.size();
    for (auto& entry : pending_) {
        entry.promise.set_value(ConfirmationDecision{ConfirmationAction::Cancelled, "", reason});
    }
    pending_.clear();
    state_ = SurfaceState::Resolved;
    if (cancelled > 0) {
        SHELLGATE_LOG_WARN("ConfirmationBroker: cancelled " + std::to_string(cancelled) +
                           " pending prompt(s)");
    }
    return cancelled;
}

std::optional<ConfirmationDecision> ConfirmationBroker::request_decision(
    const protocol::ExecutionRequest& request, const std::chrono::milliseconds timeout) {
    auto submitted = submit(request);
    if (core::errors::is_error(submitted)) {
        const auto& error = core::errors::get_error(submitted);
        return ConfirmationDecision{ConfirmationAction::Cancelled, "", error.message};
    }

    auto future = core::errors::take_value(submitted);
    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }
    if (withdraw(request.id)) {
        return std::nullopt;
    }
    // Resolved between the wait and the withdrawal.
    return future.get();
}

std::optional<PendingConfirmation> ConfirmationBroker::front() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return std::nullopt;
    }
    return pending_.front().info;
}

std::size_t ConfirmationBroker::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

SurfaceState ConfirmationBroker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConfirmationBroker::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace shellgate::ui
