#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gridsync/sync/scheduler.hpp"
#include "gridsync/view/view_model.hpp"

namespace gridsync::sync {

enum class QueueState {
    Idle,        // nothing in flight
    Debouncing,  // pending patches, debounce timer armed
    Sending,     // in_flight sent, awaiting the server
    Refetching,  // conflict: waiting out backoff / refetching the version
    Failed       // retries exhausted; frozen until the next patch
};

const char* queue_state_str(QueueState s);

/**
 * Per-view sync state. Owned and driven by ViewSyncCoordinator.
 *
 * pending:   edits inside the current debounce window, one per path
 * queued:    debounced edits waiting for the previous send to finish
 * in_flight: the exact batch last sent, kept for conflict retries
 */
class PatchQueue {
public:
    explicit PatchQueue(std::string view_id) : view_id_(std::move(view_id)) {}

    const std::string& view_id() const { return view_id_; }

    QueueState state() const { return state_; }
    void set_state(QueueState s) { state_ = s; }
    bool is_processing() const { return state_ == QueueState::Sending || state_ == QueueState::Refetching; }

    // Replaces any pending patch with the same path.
    void add_pending(view::Patch patch);

    // pending -> queued (coalesced).
    void flush_pending();

    // Coalesced queued -> in_flight; returns the batch to send.
    const std::vector<view::Patch>& take_batch();

    // Drop in_flight after success or a non-retryable rejection.
    void clear_in_flight() { in_flight_.clear(); }

    // Put in_flight back at the front of queued.
    void requeue_in_flight();

    // Append patches buffered elsewhere (suspension) and coalesce.
    void enqueue(std::vector<view::Patch> patches);

    const std::vector<view::Patch>& pending() const { return pending_; }
    const std::vector<view::Patch>& queued() const { return queued_; }
    const std::vector<view::Patch>& in_flight() const { return in_flight_; }
    bool has_work() const { return !queued_.empty(); }

    std::optional<int64_t> current_version() const { return current_version_; }

    // Never moves backwards.
    void observe_version(int64_t v) {
        if (!current_version_ || v > *current_version_) current_version_ = v;
    }

    // Authoritative value after a conflict refetch.
    void reset_version(int64_t v) { current_version_ = v; }

    int retry_count = 0;
    Scheduler::Clock::time_point last_retry_time{};
    std::optional<Scheduler::TaskId> debounce_task;
    std::optional<Scheduler::TaskId> retry_task;

private:
    std::string view_id_;
    QueueState state_ = QueueState::Idle;
    std::vector<view::Patch> pending_;
    std::vector<view::Patch> queued_;
    std::vector<view::Patch> in_flight_;
    std::optional<int64_t> current_version_;
};

} // namespace gridsync::sync
