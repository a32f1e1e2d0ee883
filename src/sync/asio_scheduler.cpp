#include "gridsync/sync/asio_scheduler.hpp"

#include <boost/asio/post.hpp>

namespace gridsync::sync {

Scheduler::TaskId AsioScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        timers_[id] = timer;
    }
    timer->async_wait([this, id, timer, task = std::move(task)](const boost::system::error_code& ec) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            timers_.erase(id);
        }
        if (!ec) task();
    });
    return id;
}

void AsioScheduler::cancel(TaskId id) {
    std::shared_ptr<boost::asio::steady_timer> timer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timers_.find(id);
        if (it == timers_.end()) return;
        timer = it->second;
        timers_.erase(it);
    }
    timer->cancel();
}

void AsioScheduler::post(Task task) {
    boost::asio::post(io_, std::move(task));
}

size_t AsioScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

} // namespace gridsync::sync
