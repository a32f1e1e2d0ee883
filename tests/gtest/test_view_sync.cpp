// =============================================================================
// View Sync Coordinator Tests
// =============================================================================
//
// Drives the coordinator on a virtual clock against an in-memory view server.
//
// =============================================================================

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "gridsync/error.hpp"
#include "gridsync/sync/view_sync_coordinator.hpp"
#include "test_support.hpp"

using namespace gridsync;
using namespace gridsync::sync;
using gridsync::fakes::FakeViewService;
using gridsync::fakes::ManualScheduler;
using gridsync::view::PatchOp;
using gridsync::view::PatchPath;
namespace json = boost::json;

using std::chrono::milliseconds;

class ViewSyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        columns = fakes::sample_columns("t1");

        grid.id = "v-grid";
        grid.table_id = "t1";
        grid.name = "Grid view";
        grid.config = view::default_config(columns);
        grid.version = 1;

        mine.id = "v1";
        mine.table_id = "t1";
        mine.name = "Mine";
        mine.config = view::default_config(columns);
        mine.config.search = "mine";
        mine.version = 1;

        service.add_view(grid);
        service.add_view(mine);

        options.debounce = milliseconds(400);
        options.retry.base_delay = milliseconds(200);
        options.retry.max_delay = milliseconds(5000);
        options.retry.max_retries = 3;

        coordinator = std::make_unique<ViewSyncCoordinator>(service, scheduler, options);

        ViewSyncCoordinator::Listener listener;
        listener.on_synced = [this](const view::View& v) { synced.push_back(v); };
        listener.on_error = [this](const std::string& id, std::exception_ptr e) {
            errors.push_back(id);
            last_error = e;
        };
        listener.on_retries_exhausted = [this](const std::string& id) { exhausted.push_back(id); };
        coordinator->set_listener(listener);

        coordinator->switch_table("t1", columns, {grid, mine});
    }

    void edit_search(const std::string& text) {
        coordinator->add_patch(PatchOp::Set, PatchPath::Search, json::value(text.c_str()));
    }

    void edit_sort(const std::string& column_id) {
        coordinator->add_patch(PatchOp::Set, PatchPath::Sort,
                               view::sort_to_json({view::SortSpec{column_id, view::SortDirection::Desc}}));
    }

    const std::vector<FakeViewService::ApplyCall>& calls() const { return service.apply_calls(); }

    std::vector<Column> columns;
    view::View grid;
    view::View mine;
    ManualScheduler scheduler;
    FakeViewService service{scheduler};
    SyncOptions options;
    std::unique_ptr<ViewSyncCoordinator> coordinator;

    std::vector<view::View> synced;
    std::vector<std::string> errors;
    std::exception_ptr last_error;
    std::vector<std::string> exhausted;
};

// =============================================================================
// Selection and UI state
// =============================================================================

TEST_F(ViewSyncTest, TableSwitchSelectsDefaultView) {
    EXPECT_EQ(coordinator->current_view_id(), "v-grid");
    EXPECT_EQ(coordinator->current_config(), view::default_config(columns));
}

TEST_F(ViewSyncTest, UiStateRestoredWithoutServerRoundTrip) {
    coordinator->select_view("v1");
    edit_search("local");
    coordinator->select_view("v-grid");
    EXPECT_EQ(coordinator->select_view("v1").search, "local");
    EXPECT_EQ(service.list_calls(), 0);
}

TEST_F(ViewSyncTest, DefaultViewAlwaysResets) {
    edit_search("zzz");
    edit_sort("col-age");
    EXPECT_EQ(coordinator->current_config().search, "zzz");

    coordinator->select_view("v1");
    const view::ViewConfig& config = coordinator->select_view("v-grid");
    EXPECT_EQ(config, view::default_config(columns));
    for (const auto& c : config.columns) EXPECT_TRUE(c.visible);
}

TEST_F(ViewSyncTest, UnknownViewIsNotFound) {
    EXPECT_THROW(coordinator->select_view("nope"), NotFoundError);
}

TEST_F(ViewSyncTest, MalformedValueChangesNothing) {
    coordinator->select_view("v1");
    EXPECT_THROW(coordinator->add_patch(PatchOp::Set, PatchPath::Sort, json::value("desc")), ValidationError);
    EXPECT_EQ(coordinator->queue("v1"), nullptr);
    EXPECT_EQ(coordinator->current_config().search, "mine");
}

// =============================================================================
// Debounce and sending
// =============================================================================

TEST_F(ViewSyncTest, DebounceRestartsOnEachEdit) {
    coordinator->select_view("v1");
    edit_search("a");
    scheduler.advance(milliseconds(300));
    edit_search("ab");
    scheduler.advance(milliseconds(399));
    EXPECT_TRUE(calls().empty());

    scheduler.advance(milliseconds(1));
    ASSERT_EQ(calls().size(), 1u);
    EXPECT_EQ(calls()[0].view_id, "v1");
    EXPECT_EQ(calls()[0].version, 1);
    ASSERT_EQ(calls()[0].patches.size(), 1u);
    EXPECT_EQ(calls()[0].patches[0].value, json::value("ab"));

    ASSERT_EQ(synced.size(), 1u);
    EXPECT_EQ(synced[0].version, 2);
    EXPECT_EQ(coordinator->queue("v1")->current_version(), 2);
    EXPECT_EQ(coordinator->queue("v1")->state(), QueueState::Idle);
    EXPECT_EQ(service.server_view("v1").config.search, "ab");
}

TEST_F(ViewSyncTest, DistinctPathsShareOneBatch) {
    coordinator->select_view("v1");
    edit_search("q");
    edit_sort("col-name");
    scheduler.advance(milliseconds(400));

    ASSERT_EQ(calls().size(), 1u);
    EXPECT_EQ(calls()[0].patches.size(), 2u);
    EXPECT_EQ(service.server_view("v1").config.sort.size(), 1u);
}

TEST_F(ViewSyncTest, OneRequestInFlightPerView) {
    service.hold_replies(true);
    coordinator->select_view("v1");
    edit_search("a");
    scheduler.advance(milliseconds(400));
    ASSERT_EQ(calls().size(), 1u);
    EXPECT_EQ(coordinator->queue("v1")->state(), QueueState::Sending);

    edit_sort("col-age");
    scheduler.advance(milliseconds(1000));
    EXPECT_EQ(calls().size(), 1u) << "second batch must wait for the first";
    EXPECT_EQ(coordinator->queue("v1")->queued().size(), 1u);

    service.release_next();
    scheduler.run_ready();
    ASSERT_EQ(calls().size(), 2u);
    EXPECT_EQ(calls()[1].version, 2);
    ASSERT_EQ(calls()[1].patches.size(), 1u);
    EXPECT_EQ(calls()[1].patches[0].path, PatchPath::Sort);

    service.release_next();
    scheduler.run_ready();
    EXPECT_EQ(service.server_view("v1").version, 3);
}

TEST_F(ViewSyncTest, StaleEchoDoesNotOverwriteNewerEdit) {
    service.hold_replies(true);
    coordinator->select_view("v1");
    edit_search("a");
    scheduler.advance(milliseconds(400));
    edit_search("ab");

    service.release_next();
    scheduler.run_ready();
    EXPECT_EQ(coordinator->current_config().search, "ab");
}

TEST_F(ViewSyncTest, VersionIncreasesByOnePerSuccess) {
    coordinator->select_view("v1");
    for (int i = 0; i < 4; ++i) {
        edit_search("s" + std::to_string(i));
        scheduler.advance(milliseconds(400));
    }
    ASSERT_EQ(synced.size(), 4u);
    for (size_t i = 0; i < synced.size(); ++i) {
        EXPECT_EQ(synced[i].version, static_cast<int64_t>(i) + 2);
    }
}

// =============================================================================
// Conflicts
// =============================================================================

TEST_F(ViewSyncTest, ConflictResendsExactInFlightBatch) {
    service.force_conflicts(2);
    coordinator->select_view("v1");
    edit_search("x");
    edit_sort("col-email");
    scheduler.advance(milliseconds(400));
    ASSERT_EQ(calls().size(), 1u);
    const std::vector<view::Patch> first = calls()[0].patches;

    scheduler.advance(milliseconds(10000));

    ASSERT_EQ(calls().size(), 3u);
    for (const auto& call : calls()) {
        EXPECT_EQ(call.patches, first);
    }
    EXPECT_EQ(calls()[0].version, 1);
    EXPECT_EQ(calls()[1].version, 2);
    EXPECT_EQ(calls()[2].version, 3);
    EXPECT_EQ(service.list_calls(), 2);
    EXPECT_EQ(coordinator->queue("v1")->current_version(), 4);
    EXPECT_EQ(coordinator->queue("v1")->retry_count, 0);
    EXPECT_TRUE(exhausted.empty());
}

TEST_F(ViewSyncTest, EditsDuringConflictRetryAreSentAfterward) {
    service.force_conflicts(1);
    coordinator->select_view("v1");
    edit_search("x");
    scheduler.advance(milliseconds(400));
    ASSERT_EQ(coordinator->queue("v1")->state(), QueueState::Refetching);

    edit_sort("col-age");
    scheduler.advance(milliseconds(10000));

    ASSERT_EQ(calls().size(), 3u);
    ASSERT_EQ(calls()[1].patches.size(), 1u);
    EXPECT_EQ(calls()[1].patches[0].path, PatchPath::Search);
    ASSERT_EQ(calls()[2].patches.size(), 1u);
    EXPECT_EQ(calls()[2].patches[0].path, PatchPath::Sort);
    EXPECT_EQ(service.server_view("v1").config.search, "x");
}

TEST_F(ViewSyncTest, ConflictBackoffDoubles) {
    service.force_conflicts(2);
    coordinator->select_view("v1");
    edit_search("x");
    scheduler.advance(milliseconds(400));
    ASSERT_EQ(calls().size(), 1u);
    EXPECT_EQ(coordinator->queue("v1")->last_retry_time, scheduler.now());

    scheduler.advance(milliseconds(199));
    EXPECT_EQ(calls().size(), 1u);
    scheduler.advance(milliseconds(1));
    EXPECT_EQ(calls().size(), 2u);

    scheduler.advance(milliseconds(399));
    EXPECT_EQ(calls().size(), 2u);
    scheduler.advance(milliseconds(1));
    EXPECT_EQ(calls().size(), 3u);
}

TEST_F(ViewSyncTest, RetriesExhaustThenNextEditRestarts) {
    service.force_conflicts(100);
    coordinator->select_view("v1");
    edit_search("x");
    scheduler.advance(milliseconds(60000));

    // Initial send plus max_retries resends, then the view freezes
    EXPECT_EQ(calls().size(), 4u);
    ASSERT_EQ(exhausted.size(), 1u);
    EXPECT_EQ(exhausted[0], "v1");
    const PatchQueue* q = coordinator->queue("v1");
    ASSERT_NE(q, nullptr);
    EXPECT_EQ(q->state(), QueueState::Failed);
    ASSERT_EQ(q->queued().size(), 1u);
    EXPECT_EQ(q->queued()[0].value, json::value("x"));

    scheduler.advance(milliseconds(60000));
    EXPECT_EQ(calls().size(), 4u);

    service.force_conflicts(0);
    edit_sort("col-name");
    EXPECT_NE(coordinator->queue("v1")->state(), QueueState::Failed);
    scheduler.advance(milliseconds(60000));

    EXPECT_EQ(exhausted.size(), 1u);
    EXPECT_EQ(coordinator->queue("v1")->state(), QueueState::Idle);
    EXPECT_EQ(service.server_view("v1").config.search, "x");
    EXPECT_EQ(service.server_view("v1").config.sort.size(), 1u);
    EXPECT_EQ(calls().back().patches.size(), 2u);
}

TEST_F(ViewSyncTest, EditWhileSuspendedUnfreezesFailedView) {
    service.force_conflicts(100);
    coordinator->select_view("v1");
    edit_search("x");
    scheduler.advance(milliseconds(60000));
    ASSERT_EQ(exhausted.size(), 1u);
    ASSERT_EQ(calls().size(), 4u);

    coordinator->suspend();
    edit_sort("col-name");
    const PatchQueue* q = coordinator->queue("v1");
    ASSERT_NE(q, nullptr);
    EXPECT_EQ(q->state(), QueueState::Idle);
    EXPECT_EQ(q->retry_count, 0);

    // One conflict after resume gets a full retry cycle
    service.force_conflicts(1);
    coordinator->resume();
    scheduler.advance(milliseconds(60000));

    EXPECT_EQ(exhausted.size(), 1u);
    ASSERT_EQ(calls().size(), 6u);
    EXPECT_EQ(calls()[4].patches, calls()[5].patches);
    EXPECT_EQ(coordinator->queue("v1")->state(), QueueState::Idle);
    EXPECT_EQ(coordinator->queue("v1")->retry_count, 0);
    EXPECT_EQ(service.server_view("v1").config.search, "x");
    EXPECT_EQ(service.server_view("v1").config.sort.size(), 1u);
}

// =============================================================================
// Other failures
// =============================================================================

TEST_F(ViewSyncTest, TransientFailureRequeuesAndRetries) {
    service.fail_next_apply(std::make_exception_ptr(TransientStoreError("connection reset")));
    coordinator->select_view("v1");
    edit_search("x");
    scheduler.advance(milliseconds(400));
    ASSERT_EQ(calls().size(), 1u);
    EXPECT_EQ(coordinator->queue("v1")->queued().size(), 1u);

    scheduler.advance(milliseconds(200));
    ASSERT_EQ(calls().size(), 2u);
    EXPECT_EQ(calls()[1].patches, calls()[0].patches);
    EXPECT_EQ(service.server_view("v1").config.search, "x");
    EXPECT_TRUE(errors.empty());
}

TEST_F(ViewSyncTest, ValidationRejectionIsReportedAndDropped) {
    service.fail_next_apply(std::make_exception_ptr(ValidationError("bad filter")));
    coordinator->select_view("v1");
    edit_search("x");
    scheduler.advance(milliseconds(400));

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_THROW(std::rethrow_exception(last_error), ValidationError);
    EXPECT_FALSE(coordinator->queue("v1")->has_work());
    EXPECT_TRUE(coordinator->queue("v1")->in_flight().empty());

    scheduler.advance(milliseconds(10000));
    EXPECT_EQ(calls().size(), 1u);
}

TEST_F(ViewSyncTest, ViewDeletedElsewhereIsForgotten) {
    view::View ghost = mine;
    ghost.id = "ghost";
    ghost.name = "Ghost";
    coordinator->switch_table("t1", columns, {grid, mine, ghost});
    coordinator->select_view("ghost");
    edit_search("x");
    scheduler.advance(milliseconds(400));

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(coordinator->queue("ghost"), nullptr);
    EXPECT_EQ(coordinator->current_view_id(), "v-grid");
    EXPECT_EQ(coordinator->views().size(), 2u);
}

// =============================================================================
// Suspension
// =============================================================================

TEST_F(ViewSyncTest, SuspendedEditsAreBufferedPerPath) {
    coordinator->suspend();
    coordinator->select_view("v1");
    edit_search("a");
    edit_search("b");
    edit_sort("col-age");
    scheduler.advance(milliseconds(5000));

    EXPECT_TRUE(calls().empty());
    EXPECT_EQ(coordinator->buffered_count(), 2u);
    EXPECT_EQ(coordinator->current_config().search, "b");
}

TEST_F(ViewSyncTest, ResumeSendsBufferAgainstFreshVersion) {
    coordinator->suspend();
    coordinator->select_view("v1");
    edit_search("a");
    edit_sort("col-age");
    service.server_view("v1").version = 7;  // changed elsewhere meanwhile

    coordinator->resume();
    scheduler.run_ready();

    EXPECT_EQ(service.list_calls(), 1);
    ASSERT_EQ(calls().size(), 1u);
    EXPECT_EQ(calls()[0].version, 7);
    EXPECT_EQ(calls()[0].patches.size(), 2u);
    EXPECT_EQ(coordinator->buffered_count(), 0u);
    EXPECT_EQ(service.server_view("v1").version, 8);
    EXPECT_EQ(coordinator->mode(), SyncMode::Active);
}

TEST_F(ViewSyncTest, SuspendHoldsQueuedWork) {
    service.hold_replies(true);
    coordinator->select_view("v1");
    edit_search("a");
    scheduler.advance(milliseconds(400));
    ASSERT_EQ(calls().size(), 1u);

    coordinator->suspend();
    edit_sort("col-name");
    service.release_next();
    scheduler.advance(milliseconds(2000));
    EXPECT_EQ(calls().size(), 1u);
    EXPECT_EQ(coordinator->buffered("v1").size(), 1u);

    service.hold_replies(false);
    coordinator->resume();
    scheduler.run_ready();
    ASSERT_EQ(calls().size(), 2u);
    EXPECT_EQ(calls()[1].version, 2);
    EXPECT_EQ(calls()[1].patches[0].path, PatchPath::Sort);
}

TEST_F(ViewSyncTest, ResumeWithNothingBufferedDoesNotRefetch) {
    coordinator->suspend();
    coordinator->resume();
    scheduler.run_ready();
    EXPECT_EQ(service.list_calls(), 0);
}

// =============================================================================
// View lifecycle
// =============================================================================

TEST_F(ViewSyncTest, CreateViewSwapsPendingForCommittedId) {
    coordinator->select_view("v1");
    std::string committed_id;
    std::string temp = coordinator->create_view("Fresh", [&](Outcome<view::View> o) {
        ASSERT_TRUE(o.ok());
        committed_id = o.value->id;
    });

    EXPECT_EQ(temp.rfind("pending-", 0), 0u);
    EXPECT_EQ(coordinator->current_view_id(), temp);
    EXPECT_EQ(coordinator->current_config().search, "mine");

    // Held, not queued, while the id is temporary
    edit_search("held");
    EXPECT_EQ(coordinator->queue(temp), nullptr);

    scheduler.run_ready();
    ASSERT_FALSE(committed_id.empty());
    EXPECT_EQ(coordinator->current_view_id(), committed_id);
    EXPECT_EQ(coordinator->current_config().search, "held");

    scheduler.advance(milliseconds(400));
    ASSERT_EQ(calls().size(), 1u);
    EXPECT_EQ(calls()[0].view_id, committed_id);
    EXPECT_EQ(calls()[0].version, 1);
    EXPECT_EQ(service.server_view(committed_id).config.search, "held");
}

TEST_F(ViewSyncTest, FailedCreateRestoresPreviousView) {
    coordinator->select_view("v1");
    service.fail_next_create(std::make_exception_ptr(ValidationError("name taken")));
    std::string temp = coordinator->create_view("Dup");
    scheduler.run_ready();

    EXPECT_EQ(coordinator->current_view_id(), "v1");
    for (const auto& e : coordinator->views()) EXPECT_NE(entry_id(e), temp);
    ASSERT_EQ(errors.size(), 1u);
}

TEST_F(ViewSyncTest, CreateRejectsBadNames) {
    EXPECT_THROW(coordinator->create_view(""), ValidationError);
    EXPECT_THROW(coordinator->create_view(std::string(101, 'n')), ValidationError);
}

TEST_F(ViewSyncTest, DeletingDefaultViewIsRejected) {
    std::exception_ptr result;
    bool called = false;
    coordinator->delete_view("v-grid", [&](std::exception_ptr e) {
        called = true;
        result = e;
    });
    scheduler.run_ready();

    ASSERT_TRUE(called);
    ASSERT_TRUE(result);
    EXPECT_THROW(std::rethrow_exception(result), ValidationError);
    EXPECT_TRUE(service.has_view("v-grid"));
    EXPECT_EQ(coordinator->views().size(), 2u);
}

TEST_F(ViewSyncTest, DeleteViewDropsItsState) {
    coordinator->select_view("v1");
    edit_search("x");
    bool done = false;
    coordinator->delete_view("v1", [&](std::exception_ptr e) {
        EXPECT_FALSE(e);
        done = true;
    });
    scheduler.run_ready();

    ASSERT_TRUE(done);
    EXPECT_EQ(coordinator->queue("v1"), nullptr);
    EXPECT_EQ(coordinator->ui_state("v1"), nullptr);
    EXPECT_EQ(coordinator->current_view_id(), "v-grid");

    scheduler.advance(milliseconds(1000));
    EXPECT_TRUE(calls().empty());
}

TEST_F(ViewSyncTest, TableSwitchCancelsPendingWork) {
    coordinator->select_view("v1");
    edit_search("x");
    coordinator->switch_table("t2", columns, {});
    scheduler.advance(milliseconds(1000));

    EXPECT_TRUE(calls().empty());
    EXPECT_EQ(coordinator->queue("v1"), nullptr);
    EXPECT_TRUE(coordinator->current_view_id().empty());
    EXPECT_THROW(coordinator->current_config(), ValidationError);
}

TEST_F(ViewSyncTest, RepliesAfterTableSwitchAreIgnored) {
    service.hold_replies(true);
    coordinator->select_view("v1");
    edit_search("x");
    scheduler.advance(milliseconds(400));
    ASSERT_EQ(calls().size(), 1u);

    coordinator->switch_table("t1", columns, {grid, mine});
    service.release_next();
    scheduler.run_ready();

    EXPECT_TRUE(synced.empty());
    EXPECT_EQ(coordinator->queue("v1"), nullptr);
}
