#pragma once

#include <map>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "gridsync/sync/scheduler.hpp"

namespace gridsync::sync {

// Scheduler backed by steady_timers on an io_context.
class AsioScheduler : public Scheduler {
public:
    explicit AsioScheduler(boost::asio::io_context& io) : io_(io) {}

    TaskId schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel(TaskId id) override;
    void post(Task task) override;
    Clock::time_point now() const override { return Clock::now(); }

    size_t pending() const;

private:
    boost::asio::io_context& io_;
    mutable std::mutex mutex_;
    std::map<TaskId, std::shared_ptr<boost::asio::steady_timer>> timers_;
    TaskId next_id_ = 1;
};

} // namespace gridsync::sync
