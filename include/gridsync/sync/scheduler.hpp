#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace gridsync::sync {

/**
 * Single logical timeline for the view sync machinery.
 *
 * All tasks run one at a time on the scheduler's thread. post() is the only
 * call that may be made from other threads.
 */
class Scheduler {
public:
    using TaskId = uint64_t;
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    virtual ~Scheduler() = default;

    virtual TaskId schedule(std::chrono::milliseconds delay, Task task) = 0;

    // No-op for unknown or already-run tasks.
    virtual void cancel(TaskId id) = 0;

    // Run as soon as possible, in posting order.
    virtual void post(Task task) = 0;

    virtual Clock::time_point now() const = 0;
};

} // namespace gridsync::sync
