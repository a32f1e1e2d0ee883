/**
 * Threading utilities for the ingestion workers
 *
 * Cooperative cancellation and progress tracking shared between the pipeline
 * and its callers (CLI progress line, tests).
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>

namespace gridsync {

/**
 * Cancellation token for cooperative cancellation across threads
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    // Request cancellation
    void cancel() {
        cancelled_.store(true, std::memory_order_release);
    }

    // Check if cancellation was requested
    bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_;
};

/**
 * Progress tracker counting completed units (rows) out of a known total.
 * The listener runs on the worker thread that advanced the count, serialized
 * by an internal mutex.
 */
class ProgressTracker {
public:
    using Listener = std::function<void(size_t completed, size_t total)>;

    explicit ProgressTracker(size_t total, Listener listener = {})
        : total_(total), completed_(0), listener_(std::move(listener)) {}

    void add(size_t units) {
        size_t current = completed_.fetch_add(units, std::memory_order_acq_rel) + units;
        if (listener_) {
            std::lock_guard<std::mutex> lock(mutex_);
            listener_(current, total_);
        }
    }

private:
    size_t total_;
    std::atomic<size_t> completed_;
    Listener listener_;
    std::mutex mutex_;
};

} // namespace gridsync
