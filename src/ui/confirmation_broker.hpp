#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/admission_pipeline.hpp"

namespace shellgate::ui {

enum class SurfaceState {
    Idle,
    Streaming,
    AwaitingConfirmation,
    Resolved
};

std::string to_string(SurfaceState state);

struct PendingConfirmation {
    std::string id;
    std::string command;
    protocol::ExecutionMode mode = protocol::ExecutionMode::Tutor;
    std::chrono::steady_clock::time_point submitted_at;
};

// Hands confirmation prompts from connection threads to the render loop.
// Requesters block on a future; the render loop never blocks on them.
class ConfirmationBroker {
public:
    // Idle -> Streaming, once the surface is drawing output.
    void start_streaming();

    // Queues a prompt and moves to AwaitingConfirmation. Fails after
    // cancel_all() ("surface_closed") or for an id already pending.
    core::errors::Result<std::future<runtime::ConfirmationDecision>> submit(
        const protocol::ExecutionRequest& request);

    // Fulfils the prompt and moves to Resolved. False if it is not pending
    // (already withdrawn or resolved).
    bool resolve(const std::string& id, const runtime::ConfirmationDecision& decision);

    // Drops a prompt whose request timed out; nobody is told.
    bool withdraw(const std::string& id);

    // Render loop acknowledges a resolution: back to Streaming, or to
    // AwaitingConfirmation while more prompts wait.
    void acknowledge();

    // Resolves every prompt as Cancelled and refuses later submissions.
    std::size_t cancel_all(const std::string& reason = "Confirmation surface closed.");

    // Blocking helper with the shape of runtime::ConfirmationCallback.
    std::optional<runtime::ConfirmationDecision> request_decision(
        const protocol::ExecutionRequest& request, std::chrono::milliseconds timeout);

    std::optional<PendingConfirmation> front() const;
    std::size_t pending_count() const;
    SurfaceState state() const;
    bool closed() const;

private:
    struct Entry {
        PendingConfirmation info;
        std::promise<runtime::ConfirmationDecision> promise;
    };

    mutable std::mutex mutex_;
    std::deque<Entry> pending_;
    SurfaceState state_ = SurfaceState::Idle;
    bool closed_ = false;
};

}  // namespace shellgate::ui
