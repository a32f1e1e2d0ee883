#include "gridsync/sync/view_sync_coordinator.hpp"

#include <algorithm>
#include <set>

#include "gridsync/error.hpp"
#include "gridsync/logging.hpp"
#include "gridsync/store/view_store.hpp"
#include "gridsync/view/patch_coalescer.hpp"

namespace gridsync::sync {

namespace {

void remove_same_path(std::vector<view::Patch>& patches, view::PatchPath path) {
    patches.erase(std::remove_if(patches.begin(), patches.end(),
                                 [&](const view::Patch& p) { return p.path == path; }),
                  patches.end());
}

const view::View* find_in(const std::vector<view::View>& views, const std::string& id) {
    for (const auto& v : views) {
        if (v.id == id) return &v;
    }
    return nullptr;
}

} // anonymous namespace

const std::string& entry_id(const ViewEntry& entry) {
    if (const auto* pending = std::get_if<PendingView>(&entry)) return pending->temp_id;
    return std::get<CommittedView>(entry).view.id;
}

ViewSyncCoordinator::ViewSyncCoordinator(ViewService& service, Scheduler& scheduler, SyncOptions options)
    : service_(service), scheduler_(scheduler), options_(options) {}

ViewSyncCoordinator::~ViewSyncCoordinator() {
    for (auto& [id, q] : queues_) {
        cancel_timers(*q);
    }
}

// Wraps a completion so it is dropped once the coordinator is gone or the table changed.
template <typename Fn>
auto ViewSyncCoordinator::guarded(Fn fn) {
    return [this, alive = std::weak_ptr<char>(alive_), epoch = epoch_, fn = std::move(fn)](auto&&... args) mutable {
        if (alive.expired() || epoch != epoch_) return;
        fn(std::forward<decltype(args)>(args)...);
    };
}

// =============================================================================
// Lookup
// =============================================================================

ViewEntry* ViewSyncCoordinator::find_entry(const std::string& id) {
    for (auto& e : entries_) {
        if (entry_id(e) == id) return &e;
    }
    return nullptr;
}

const ViewEntry* ViewSyncCoordinator::find_entry(const std::string& id) const {
    for (const auto& e : entries_) {
        if (entry_id(e) == id) return &e;
    }
    return nullptr;
}

PatchQueue* ViewSyncCoordinator::find_queue(const std::string& view_id) {
    auto it = queues_.find(view_id);
    return it == queues_.end() ? nullptr : it->second.get();
}

const PatchQueue* ViewSyncCoordinator::queue(const std::string& view_id) const {
    auto it = queues_.find(view_id);
    return it == queues_.end() ? nullptr : it->second.get();
}

PatchQueue& ViewSyncCoordinator::ensure_queue(const std::string& view_id) {
    auto& slot = queues_[view_id];
    if (!slot) {
        slot = std::make_unique<PatchQueue>(view_id);
        if (const ViewEntry* e = find_entry(view_id)) {
            if (const auto* committed = std::get_if<CommittedView>(e)) {
                slot->observe_version(committed->view.version);
            }
        }
    }
    return *slot;
}

std::vector<view::Patch> ViewSyncCoordinator::buffered(const std::string& view_id) const {
    auto it = buffer_.find(view_id);
    return it == buffer_.end() ? std::vector<view::Patch>{} : it->second;
}

size_t ViewSyncCoordinator::buffered_count() const {
    size_t n = 0;
    for (const auto& [id, patches] : buffer_) n += patches.size();
    return n;
}

const view::ViewConfig* ViewSyncCoordinator::ui_state(const std::string& view_id) const {
    auto it = ui_.find(view_id);
    return it == ui_.end() ? nullptr : &it->second;
}

const view::ViewConfig& ViewSyncCoordinator::current_config() const {
    auto it = ui_.find(current_view_);
    if (current_view_.empty() || it == ui_.end()) {
        throw ValidationError("No view selected");
    }
    return it->second;
}

// =============================================================================
// Table and view selection
// =============================================================================

void ViewSyncCoordinator::switch_table(const std::string& table_id, std::vector<Column> columns,
                                       std::vector<view::View> views) {
    for (auto& [id, q] : queues_) {
        cancel_timers(*q);
    }
    queues_.clear();
    buffer_.clear();
    held_.clear();
    ++epoch_;

    table_id_ = table_id;
    columns_ = std::move(columns);
    entries_.clear();
    current_view_.clear();
    for (auto& v : views) {
        entries_.push_back(CommittedView{std::move(v)});
    }

    LOG_DEBUG("Switched to table ", table_id, " (", entries_.size(), " views)");

    for (const auto& e : entries_) {
        const auto& v = std::get<CommittedView>(e).view;
        if (view::is_default_view(v.name)) {
            select_view(v.id);
            return;
        }
    }
    if (!entries_.empty()) {
        select_view(entry_id(entries_.front()));
    }
}

const view::ViewConfig& ViewSyncCoordinator::select_view(const std::string& view_id) {
    const ViewEntry* entry = find_entry(view_id);
    if (!entry) {
        throw NotFoundError("View not found", "view " + view_id);
    }
    current_view_ = view_id;

    if (const auto* committed = std::get_if<CommittedView>(entry)) {
        if (view::is_default_view(committed->view.name)) {
            ui_[view_id] = view::default_config(columns_);
        } else if (ui_.find(view_id) == ui_.end()) {
            ui_[view_id] = committed->view.config;
        }
    } else if (ui_.find(view_id) == ui_.end()) {
        ui_[view_id] = std::get<PendingView>(*entry).config;
    }
    return ui_[view_id];
}

// =============================================================================
// Editing
// =============================================================================

int64_t ViewSyncCoordinator::next_timestamp() {
    int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
        scheduler_.now().time_since_epoch()).count();
    last_timestamp_ = std::max(now, last_timestamp_ + 1);
    return last_timestamp_;
}

void ViewSyncCoordinator::add_patch(view::PatchOp op, view::PatchPath path, view::json::value value) {
    if (current_view_.empty()) {
        throw ValidationError("No view selected");
    }
    view::Patch patch{op, path, std::move(value), next_timestamp()};

    // Validates the value before anything is queued.
    view::ViewConfig updated = current_config();
    view::apply_patch(updated, patch);
    ui_[current_view_] = std::move(updated);

    route_patch(current_view_, std::move(patch));
}

void ViewSyncCoordinator::set_filters(const std::vector<view::FilterGroup>& incoming) {
    auto merged = view::merge_filters(current_config().filters, incoming);
    add_patch(view::PatchOp::Set, view::PatchPath::Filters, view::filters_to_json(merged));
}

void ViewSyncCoordinator::route_patch(const std::string& view_id, view::Patch patch) {
    const ViewEntry* entry = find_entry(view_id);
    if (entry && std::holds_alternative<PendingView>(*entry)) {
        auto& held = held_[view_id];
        remove_same_path(held, patch.path);
        held.push_back(std::move(patch));
        return;
    }

    // A new edit unfreezes a failed view, even while suspended.
    if (PatchQueue* existing = find_queue(view_id); existing && existing->state() == QueueState::Failed) {
        LOG_INFO("View ", view_id, " unfrozen by a new edit");
        existing->retry_count = 0;
        existing->set_state(QueueState::Idle);
    }

    if (mode_ == SyncMode::Suspended) {
        auto& buf = buffer_[view_id];
        remove_same_path(buf, patch.path);
        buf.push_back(std::move(patch));
        LOG_DEBUG("Suspended: buffered ", view::patch_path_str(buf.back().path), " for view ", view_id);
        return;
    }

    PatchQueue& q = ensure_queue(view_id);
    q.add_pending(std::move(patch));
    arm_debounce(q);
}

void ViewSyncCoordinator::cancel_timers(PatchQueue& q) {
    if (q.debounce_task) {
        scheduler_.cancel(*q.debounce_task);
        q.debounce_task.reset();
    }
    if (q.retry_task) {
        scheduler_.cancel(*q.retry_task);
        q.retry_task.reset();
    }
}

void ViewSyncCoordinator::arm_debounce(PatchQueue& q) {
    if (q.debounce_task) {
        scheduler_.cancel(*q.debounce_task);
    }
    std::string id = q.view_id();
    q.debounce_task = scheduler_.schedule(options_.debounce, guarded([this, id]() { on_debounce(id); }));
    if (!q.is_processing()) {
        q.set_state(QueueState::Debouncing);
    }
}

void ViewSyncCoordinator::on_debounce(const std::string& view_id) {
    PatchQueue* q = find_queue(view_id);
    if (!q) return;
    q->debounce_task.reset();
    q->flush_pending();
    if (q->state() == QueueState::Debouncing) {
        q->set_state(QueueState::Idle);
    }
    drain(*q);
}

// =============================================================================
// Sending
// =============================================================================

void ViewSyncCoordinator::drain(PatchQueue& q) {
    if (mode_ == SyncMode::Suspended) return;
    if (q.is_processing() || q.state() == QueueState::Failed) return;
    if (q.retry_task) return;  // transient failure backoff pending
    if (!q.has_work()) return;

    q.take_batch();
    if (!q.current_version()) {
        // No version observed yet: learn it the same way a conflict does.
        q.set_state(QueueState::Refetching);
        refetch_and_resend(q.view_id());
        return;
    }
    dispatch(q);
}

void ViewSyncCoordinator::dispatch(PatchQueue& q) {
    q.set_state(QueueState::Sending);
    int64_t version = *q.current_version();
    std::string id = q.view_id();
    LOG_DEBUG("Sending ", q.in_flight().size(), " patches for view ", id, " at version ", version);

    service_.apply_patches(id, version, q.in_flight(),
                           guarded([this, id](Outcome<view::View> outcome) {
                               on_apply_result(id, std::move(outcome));
                           }));
}

void ViewSyncCoordinator::on_apply_result(const std::string& view_id, Outcome<view::View> outcome) {
    PatchQueue* q = find_queue(view_id);
    if (!q) return;

    if (outcome.ok()) {
        view::View v = std::move(*outcome.value);
        q->observe_version(v.version);
        v.version = *q->current_version();
        q->clear_in_flight();
        q->retry_count = 0;
        q->set_state(q->pending().empty() ? QueueState::Idle : QueueState::Debouncing);

        if (ViewEntry* e = find_entry(view_id)) {
            *e = CommittedView{v};
        }

        // Canonical config plus everything not yet acknowledged, oldest first,
        // so a stale echo never overwrites a newer local edit. The default
        // view's UI state is local only (reset on every selection).
        if (!view::is_default_view(v.name)) {
            view::ViewConfig ui = v.config;
            for (const auto& p : q->queued()) view::apply_patch(ui, p);
            for (const auto& p : q->pending()) view::apply_patch(ui, p);
            for (const auto& p : buffered(view_id)) view::apply_patch(ui, p);
            ui_[view_id] = std::move(ui);
        }

        LOG_DEBUG("View ", view_id, " synced at version ", v.version);
        if (listener_.on_synced) listener_.on_synced(v);
        drain(*q);
        return;
    }

    try {
        std::rethrow_exception(outcome.error);
    } catch (const VersionConflictError& e) {
        LOG_WARN("Version conflict on view ", view_id, ": ", e.message());
        on_conflict(*q);
    } catch (const NotFoundError& e) {
        LOG_WARN("View ", view_id, " no longer exists: ", e.message());
        on_view_deleted(view_id);
        notify_error(view_id, outcome.error);
    } catch (const ValidationError& e) {
        LOG_ERROR("Server rejected patches for view ", view_id, ": ", e.message());
        q->clear_in_flight();
        q->set_state(QueueState::Idle);
        notify_error(view_id, outcome.error);
        drain(*q);
    } catch (const std::exception& e) {
        on_transient_failure(*q, e);
    }
}

void ViewSyncCoordinator::on_conflict(PatchQueue& q) {
    q.retry_count++;
    if (options_.retry.exhausted(q.retry_count)) {
        exhaust(q);
        return;
    }
    auto delay = options_.retry.delay(q.retry_count);
    q.set_state(QueueState::Refetching);
    q.last_retry_time = scheduler_.now();
    LOG_INFO("Retrying view ", q.view_id(), " in ", delay.count(), "ms (attempt ", q.retry_count,
             "/", options_.retry.max_retries, ")");

    std::string id = q.view_id();
    q.retry_task = scheduler_.schedule(delay, guarded([this, id]() {
        if (PatchQueue* pq = find_queue(id)) pq->retry_task.reset();
        refetch_and_resend(id);
    }));
}

void ViewSyncCoordinator::on_transient_failure(PatchQueue& q, const std::exception& e) {
    LOG_WARN("Sending patches for view ", q.view_id(), " failed: ", e.what());
    q.requeue_in_flight();
    q.retry_count++;
    if (options_.retry.exhausted(q.retry_count)) {
        exhaust(q);
        return;
    }
    q.set_state(QueueState::Idle);
    q.last_retry_time = scheduler_.now();

    std::string id = q.view_id();
    q.retry_task = scheduler_.schedule(options_.retry.delay(q.retry_count), guarded([this, id]() {
        PatchQueue* pq = find_queue(id);
        if (!pq) return;
        pq->retry_task.reset();
        drain(*pq);
    }));
}

void ViewSyncCoordinator::refetch_and_resend(const std::string& view_id) {
    service_.list_views(table_id_, guarded([this, view_id](Outcome<std::vector<view::View>> outcome) {
        PatchQueue* q = find_queue(view_id);
        if (!q) return;

        if (!outcome.ok()) {
            LOG_WARN("Refetch for view ", view_id, " failed");
            on_conflict(*q);
            return;
        }

        const view::View* server = find_in(*outcome.value, view_id);
        if (!server) {
            LOG_WARN("View ", view_id, " disappeared during conflict retry");
            on_view_deleted(view_id);
            notify_error(view_id, std::make_exception_ptr(NotFoundError("View not found", "view " + view_id)));
            return;
        }

        q->reset_version(server->version);
        if (ViewEntry* e = find_entry(view_id)) {
            std::get<CommittedView>(*e).view.version = server->version;
        }
        if (mode_ == SyncMode::Suspended) {
            // Resent by resume().
            q->requeue_in_flight();
            q->set_state(QueueState::Idle);
            return;
        }
        dispatch(*q);
    }));
}

void ViewSyncCoordinator::exhaust(PatchQueue& q) {
    LOG_WARN("Giving up on view ", q.view_id(), " after ", q.retry_count - 1,
             " retries; frozen until the next edit");
    q.requeue_in_flight();
    q.set_state(QueueState::Failed);
    if (listener_.on_retries_exhausted) listener_.on_retries_exhausted(q.view_id());
}

void ViewSyncCoordinator::notify_error(const std::string& view_id, std::exception_ptr error) {
    if (listener_.on_error) listener_.on_error(view_id, std::move(error));
}

// =============================================================================
// Suspension
// =============================================================================

void ViewSyncCoordinator::suspend() {
    if (mode_ == SyncMode::Suspended) return;
    mode_ = SyncMode::Suspended;
    LOG_INFO("View sync suspended");
}

void ViewSyncCoordinator::resume() {
    if (mode_ == SyncMode::Active) return;
    mode_ = SyncMode::Active;

    auto buffered = std::move(buffer_);
    buffer_.clear();
    LOG_INFO("View sync resumed (", buffered.size(), " views with buffered edits)");

    if (buffered.empty()) {
        for (auto& [id, q] : queues_) drain(*q);
        return;
    }

    // Queues parked here wait for the refetch; busy ones keep their send cycle.
    std::set<std::string> parked;
    for (const auto& [id, patches] : buffered) {
        PatchQueue& q = ensure_queue(id);
        if (!q.is_processing()) {
            q.set_state(QueueState::Refetching);
            parked.insert(id);
        }
    }

    service_.list_views(table_id_, guarded(
        [this, buffered = std::move(buffered), parked = std::move(parked)](
            Outcome<std::vector<view::View>> outcome) mutable {
            resume_with_versions(std::move(buffered), parked, std::move(outcome));
        }));
}

void ViewSyncCoordinator::resume_with_versions(std::map<std::string, std::vector<view::Patch>> buffered,
                                               const std::set<std::string>& parked,
                                               Outcome<std::vector<view::View>> outcome) {
    if (!outcome.ok()) {
        LOG_WARN("Version refetch on resume failed; sending with last known versions");
    }

    for (auto& [id, patches] : buffered) {
        PatchQueue* q = find_queue(id);
        if (!q) continue;
        const bool was_parked = parked.count(id) > 0 && q->state() == QueueState::Refetching;

        if (outcome.ok()) {
            const view::View* server = find_in(*outcome.value, id);
            if (!server) {
                LOG_WARN("Dropping ", patches.size(), " buffered edits for deleted view ", id);
                on_view_deleted(id);
                continue;
            }
            if (was_parked) {
                q->reset_version(server->version);
            }
        }
        q->enqueue(view::coalesce_patches(std::move(patches)));
        if (was_parked) {
            q->set_state(q->pending().empty() ? QueueState::Idle : QueueState::Debouncing);
        }
    }

    for (auto& [id, q] : queues_) drain(*q);
}

// =============================================================================
// View lifecycle
// =============================================================================

std::string ViewSyncCoordinator::create_view(const std::string& name, ViewService::ViewCallback done) {
    store::validate_view_name(name);

    std::string temp_id = "pending-" + std::to_string(next_temp_id_++);
    view::ViewConfig config = current_view_.empty() ? view::default_config(columns_) : current_config();
    entries_.push_back(PendingView{temp_id, table_id_, name, config});
    ui_[temp_id] = config;
    std::string previous = current_view_;
    current_view_ = temp_id;

    service_.create_view(table_id_, name, config,
        guarded([this, temp_id, previous, done](Outcome<view::View> outcome) {
            ViewEntry* entry = find_entry(temp_id);
            if (!entry) return;

            if (!outcome.ok()) {
                entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                              [&](const ViewEntry& e) { return entry_id(e) == temp_id; }),
                               entries_.end());
                ui_.erase(temp_id);
                held_.erase(temp_id);
                if (current_view_ == temp_id) {
                    current_view_.clear();
                    if (find_entry(previous)) select_view(previous);
                }
                notify_error(temp_id, outcome.error);
                if (done) done(std::move(outcome));
                return;
            }

            const view::View& v = *outcome.value;
            *entry = CommittedView{v};
            ui_[v.id] = std::move(ui_[temp_id]);
            ui_.erase(temp_id);
            if (current_view_ == temp_id) current_view_ = v.id;
            LOG_DEBUG("View ", temp_id, " committed as ", v.id);

            auto held = std::move(held_[temp_id]);
            held_.erase(temp_id);
            ensure_queue(v.id);
            for (auto& p : held) {
                route_patch(v.id, std::move(p));
            }
            if (done) done(std::move(outcome));
        }));
    return temp_id;
}

void ViewSyncCoordinator::delete_view(const std::string& view_id, ViewService::DoneCallback done) {
    auto reject = [this, done](std::exception_ptr error) {
        if (done) scheduler_.post([done, error]() { done(error); });
    };

    const ViewEntry* entry = find_entry(view_id);
    if (!entry) {
        reject(std::make_exception_ptr(NotFoundError("View not found", "view " + view_id)));
        return;
    }
    if (std::holds_alternative<PendingView>(*entry)) {
        reject(std::make_exception_ptr(ValidationError("View is still being created", "view " + view_id)));
        return;
    }
    if (view::is_default_view(std::get<CommittedView>(*entry).view.name)) {
        reject(std::make_exception_ptr(ValidationError("Cannot delete the default view", "view " + view_id)));
        return;
    }

    service_.delete_view(view_id, guarded([this, view_id, done](std::exception_ptr error) {
        if (error) {
            LOG_WARN("Deleting view ", view_id, " failed");
            notify_error(view_id, error);
        } else {
            on_view_deleted(view_id);
        }
        if (done) done(error);
    }));
}

void ViewSyncCoordinator::on_view_deleted(const std::string& view_id) {
    if (PatchQueue* q = find_queue(view_id)) {
        cancel_timers(*q);
        queues_.erase(view_id);
    }
    buffer_.erase(view_id);
    held_.erase(view_id);
    ui_.erase(view_id);
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const ViewEntry& e) { return entry_id(e) == view_id; }),
                   entries_.end());

    if (current_view_ != view_id) return;
    current_view_.clear();
    for (const auto& e : entries_) {
        if (const auto* c = std::get_if<CommittedView>(&e); c && view::is_default_view(c->view.name)) {
            select_view(c->view.id);
            return;
        }
    }
    if (!entries_.empty()) select_view(entry_id(entries_.front()));
}

} // namespace gridsync::sync
