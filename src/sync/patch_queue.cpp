#include "gridsync/sync/patch_queue.hpp"

#include <algorithm>

#include "gridsync/view/patch_coalescer.hpp"

namespace gridsync::sync {

const char* queue_state_str(QueueState s) {
    switch (s) {
        case QueueState::Idle:       return "idle";
        case QueueState::Debouncing: return "debouncing";
        case QueueState::Sending:    return "sending";
        case QueueState::Refetching: return "refetching";
        case QueueState::Failed:     return "failed";
    }
    return "idle";
}

void PatchQueue::add_pending(view::Patch patch) {
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&](const view::Patch& p) { return p.path == patch.path; }),
                   pending_.end());
    pending_.push_back(std::move(patch));
}

void PatchQueue::flush_pending() {
    if (pending_.empty()) return;
    queued_.insert(queued_.end(), std::make_move_iterator(pending_.begin()),
                   std::make_move_iterator(pending_.end()));
    pending_.clear();
    queued_ = view::coalesce_patches(std::move(queued_));
}

const std::vector<view::Patch>& PatchQueue::take_batch() {
    in_flight_ = view::coalesce_patches(std::move(queued_));
    queued_.clear();
    return in_flight_;
}

void PatchQueue::requeue_in_flight() {
    if (in_flight_.empty()) return;
    queued_.insert(queued_.begin(), std::make_move_iterator(in_flight_.begin()),
                   std::make_move_iterator(in_flight_.end()));
    in_flight_.clear();
    queued_ = view::coalesce_patches(std::move(queued_));
}

void PatchQueue::enqueue(std::vector<view::Patch> patches) {
    if (patches.empty()) return;
    queued_.insert(queued_.end(), std::make_move_iterator(patches.begin()),
                   std::make_move_iterator(patches.end()));
    queued_ = view::coalesce_patches(std::move(queued_));
}

} // namespace gridsync::sync
