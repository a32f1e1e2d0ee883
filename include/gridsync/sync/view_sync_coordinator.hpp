#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "gridsync/config.hpp"
#include "gridsync/sync/patch_queue.hpp"
#include "gridsync/sync/scheduler.hpp"
#include "gridsync/sync/view_service.hpp"
#include "gridsync/util/backoff.hpp"
#include "gridsync/view/view_model.hpp"

namespace gridsync::sync {

enum class SyncMode { Active, Suspended };

// Optimistic view awaiting its server id. Never gets a PatchQueue.
struct PendingView {
    std::string temp_id;
    std::string table_id;
    std::string name;
    view::ViewConfig config;
};

struct CommittedView {
    view::View view;
};

using ViewEntry = std::variant<PendingView, CommittedView>;

const std::string& entry_id(const ViewEntry& entry);

struct SyncOptions {
    std::chrono::milliseconds debounce{400};
    RetryPolicy retry;

    static SyncOptions from_config(const Config& config) {
        SyncOptions o;
        o.debounce = std::chrono::milliseconds(config.get<int>("sync.debounce_ms", 400));
        o.retry.base_delay = std::chrono::milliseconds(config.get<int>("sync.retry_base_ms", 200));
        o.retry.max_delay = std::chrono::milliseconds(config.get<int>("sync.retry_max_ms", 5000));
        o.retry.max_retries = config.get<int>("sync.max_retries", 5);
        return o;
    }
};

/**
 * Client-side owner of all per-view sync state for the open table.
 *
 * Edits become path-scoped patches. Each view's patches are debounced,
 * coalesced and sent one batch at a time against the last version the
 * server reported. A version conflict refetches the view list and resends
 * the same in-flight batch with exponential backoff; once retries are
 * exhausted the view freezes until its next edit.
 *
 * While suspended (bulk ingestion), edits are buffered per view and no
 * send starts. resume() refetches versions and sends each buffer as one
 * batch.
 *
 * Not thread-safe: every call and every callback runs on the Scheduler.
 */
class ViewSyncCoordinator {
public:
    struct Listener {
        // Server accepted a batch; carries the canonical record.
        std::function<void(const view::View&)> on_synced;
        // User-facing, non-retryable failure (validation, not found, create/delete errors).
        std::function<void(const std::string& view_id, std::exception_ptr)> on_error;
        // Conflict or transient retries ran out; view is frozen until the next edit.
        std::function<void(const std::string& view_id)> on_retries_exhausted;
    };

    ViewSyncCoordinator(ViewService& service, Scheduler& scheduler, SyncOptions options = {});
    ~ViewSyncCoordinator();

    ViewSyncCoordinator(const ViewSyncCoordinator&) = delete;
    ViewSyncCoordinator& operator=(const ViewSyncCoordinator&) = delete;

    void set_listener(Listener listener) { listener_ = std::move(listener); }

    // -------------------------------------------------------------------------
    // Table and view selection
    // -------------------------------------------------------------------------

    /**
     * Open a table: drops every queue, buffer and timer of the previous one
     * and selects the default view (or the first view).
     */
    void switch_table(const std::string& table_id, std::vector<Column> columns,
                      std::vector<view::View> views);

    /**
     * Select a view and return its UI state: the stored state for that id,
     * else the server config. The default view always resets to all columns
     * visible with no filters, sort or search.
     * Throws NotFoundError for an unknown id.
     */
    const view::ViewConfig& select_view(const std::string& view_id);

    const std::string& table_id() const { return table_id_; }
    const std::string& current_view_id() const { return current_view_; }
    const std::vector<ViewEntry>& views() const { return entries_; }

    // Throws ValidationError when no view is selected.
    const view::ViewConfig& current_config() const;

    // nullptr if the view has no stored UI state.
    const view::ViewConfig* ui_state(const std::string& view_id) const;

    // -------------------------------------------------------------------------
    // Editing
    // -------------------------------------------------------------------------

    /**
     * Record an edit on the current view. The UI state changes immediately;
     * delivery is debounced (active) or buffered (suspended).
     * Throws ValidationError for a malformed value or with no view selected.
     */
    void add_patch(view::PatchOp op, view::PatchPath path, view::json::value value);

    // Upsert groups by id into the current filters (empty clears) and patch the result.
    void set_filters(const std::vector<view::FilterGroup>& incoming);

    // -------------------------------------------------------------------------
    // Suspension
    // -------------------------------------------------------------------------

    void suspend();
    void resume();
    SyncMode mode() const { return mode_; }

    // -------------------------------------------------------------------------
    // View lifecycle
    // -------------------------------------------------------------------------

    /**
     * Create a view from the current UI state. The returned temporary id is
     * selected at once; edits made before the server answers are held and
     * queued under the committed id.
     */
    std::string create_view(const std::string& name, ViewService::ViewCallback done = {});

    // Deleting the default view or a pending view fails with ValidationError.
    void delete_view(const std::string& view_id, ViewService::DoneCallback done = {});

    // Forget every trace of a view deleted elsewhere.
    void on_view_deleted(const std::string& view_id);

    // -------------------------------------------------------------------------
    // Introspection
    // -------------------------------------------------------------------------

    const PatchQueue* queue(const std::string& view_id) const;
    std::vector<view::Patch> buffered(const std::string& view_id) const;
    size_t buffered_count() const;

private:
    template <typename Fn>
    auto guarded(Fn fn);

    ViewEntry* find_entry(const std::string& id);
    const ViewEntry* find_entry(const std::string& id) const;
    PatchQueue* find_queue(const std::string& view_id);
    PatchQueue& ensure_queue(const std::string& view_id);

    int64_t next_timestamp();
    void cancel_timers(PatchQueue& q);
    void arm_debounce(PatchQueue& q);
    void on_debounce(const std::string& view_id);
    void drain(PatchQueue& q);
    void dispatch(PatchQueue& q);
    void on_apply_result(const std::string& view_id, Outcome<view::View> outcome);
    void on_conflict(PatchQueue& q);
    void on_transient_failure(PatchQueue& q, const std::exception& e);
    void refetch_and_resend(const std::string& view_id);
    void exhaust(PatchQueue& q);
    void resume_with_versions(std::map<std::string, std::vector<view::Patch>> buffered,
                              const std::set<std::string>& parked,
                              Outcome<std::vector<view::View>> outcome);
    void route_patch(const std::string& view_id, view::Patch patch);
    void notify_error(const std::string& view_id, std::exception_ptr error);

    ViewService& service_;
    Scheduler& scheduler_;
    SyncOptions options_;
    Listener listener_;

    SyncMode mode_ = SyncMode::Active;
    std::string table_id_;
    std::vector<Column> columns_;
    std::vector<ViewEntry> entries_;
    std::string current_view_;

    std::map<std::string, std::unique_ptr<PatchQueue>> queues_;
    std::map<std::string, std::vector<view::Patch>> buffer_;      // suspended edits per view
    std::map<std::string, std::vector<view::Patch>> held_;        // edits on pending views
    std::map<std::string, view::ViewConfig> ui_;                  // per-view UI state

    uint64_t epoch_ = 0;            // bumped on table switch; stale callbacks compare against it
    uint64_t next_temp_id_ = 1;
    int64_t last_timestamp_ = 0;
    std::shared_ptr<char> alive_ = std::make_shared<char>(0);
};

} // namespace gridsync::sync
