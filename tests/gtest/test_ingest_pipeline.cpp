// =============================================================================
// Bulk Ingestion Pipeline Tests
// =============================================================================

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

#include "gridsync/error.hpp"
#include "gridsync/ingest/pipeline.hpp"
#include "test_support.hpp"

using namespace gridsync;
using namespace gridsync::ingest;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockBatchWriter : public BatchWriter {
public:
    MOCK_METHOD(void, begin_bulk_load, (size_t total_cells), (override));
    MOCK_METHOD(void, end_bulk_load, (), (override));
    MOCK_METHOD(void, write_batch,
                (const std::string& table_id, const std::vector<Column>& columns,
                 const BatchSpec& batch, uint64_t seed),
                (override));
};

class MockTableStore : public store::TableStore {
public:
    MOCK_METHOD(std::vector<Column>, load_columns, (const std::string&, const std::string&), (override));
    MOCK_METHOD(std::vector<Row>, fetch_rows_after,
                (const std::string&, const std::string&, const std::optional<RowKey>&, size_t), (override));
    MOCK_METHOD(int64_t, count_rows, (const std::string&, const std::string&), (override));
};

// Tracks how many write_batch calls overlap.
class ConcurrencyTracker : public BatchWriter {
public:
    void write_batch(const std::string&, const std::vector<Column>&, const BatchSpec& batch,
                     uint64_t seed) override {
        int now = ++active_;
        int prev = peak_.load();
        while (now > prev && !peak_.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sizes_.push_back(batch.count);
            seeds_.insert(seed);
        }
        --active_;
    }

    int peak() const { return peak_.load(); }
    std::vector<size_t> sizes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = sizes_;
        std::sort(s.begin(), s.end());
        return s;
    }
    size_t distinct_seeds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seeds_.size();
    }

private:
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
    mutable std::mutex mutex_;
    std::vector<size_t> sizes_;
    std::set<uint64_t> seeds_;
};

} // namespace

class IngestPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(tables, load_columns("alice", "t1")).WillByDefault(Return(fakes::sample_columns("t1")));
        options.batch_size = 35000;
        options.max_concurrency = 2;
        options.max_rows = 100000;
    }

    ::testing::NiceMock<MockTableStore> tables;
    IngestOptions options;
};

// 3 columns, 70001 rows: batches of 35000, 35000 and 1 under the concurrency bound
TEST_F(IngestPipelineTest, SeventyThousandAndOneRows) {
    ConcurrencyTracker writer;
    BulkIngestionPipeline pipeline(tables, writer, options);

    IngestResult result = pipeline.ingest("alice", "t1", 70001);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.rows_added, 70001u);
    EXPECT_EQ(result.batches_committed, 3u);
    EXPECT_EQ(writer.sizes(), (std::vector<size_t>{1, 35000, 35000}));
    EXPECT_LE(writer.peak(), 2);
    EXPECT_EQ(writer.distinct_seeds(), 3u);
}

TEST_F(IngestPipelineTest, ConcurrencyNeverExceedsBound) {
    options.batch_size = 10;
    options.max_concurrency = 3;
    ConcurrencyTracker writer;
    BulkIngestionPipeline pipeline(tables, writer, options);

    IngestResult result = pipeline.ingest("alice", "t1", 200);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.batches_committed, 20u);
    EXPECT_LE(writer.peak(), 3);
    EXPECT_GE(writer.peak(), 1);
}

TEST_F(IngestPipelineTest, ZeroCountTouchesNothing) {
    MockBatchWriter writer;
    EXPECT_CALL(tables, load_columns(_, _)).Times(0);
    EXPECT_CALL(writer, begin_bulk_load(_)).Times(0);
    EXPECT_CALL(writer, write_batch(_, _, _, _)).Times(0);
    BulkIngestionPipeline pipeline(tables, writer, options);

    IngestResult result = pipeline.ingest("alice", "t1", 0);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.rows_added, 0u);
}

TEST_F(IngestPipelineTest, OutOfRangeCountsAreValidationErrors) {
    MockBatchWriter writer;
    EXPECT_CALL(writer, write_batch(_, _, _, _)).Times(0);
    BulkIngestionPipeline pipeline(tables, writer, options);

    EXPECT_THROW(pipeline.ingest("alice", "t1", -1), ValidationError);
    EXPECT_THROW(pipeline.ingest("alice", "t1", 100001), ValidationError);
}

TEST_F(IngestPipelineTest, UnknownTableIsNotFound) {
    MockBatchWriter writer;
    EXPECT_CALL(tables, load_columns("alice", "nope"))
        .WillOnce(Throw(NotFoundError("Table not found")));
    EXPECT_CALL(writer, write_batch(_, _, _, _)).Times(0);
    BulkIngestionPipeline pipeline(tables, writer, options);

    EXPECT_THROW(pipeline.ingest("alice", "nope", 10), NotFoundError);
}

TEST_F(IngestPipelineTest, ColumnsLoadedOnceAndShared) {
    MockBatchWriter writer;
    options.batch_size = 10;
    EXPECT_CALL(tables, load_columns("alice", "t1")).Times(1);
    EXPECT_CALL(writer, write_batch("t1", ::testing::SizeIs(3), _, _)).Times(5);
    BulkIngestionPipeline pipeline(tables, writer, options);

    EXPECT_TRUE(pipeline.ingest("alice", "t1", 50).success);
}

// A failed batch is reported; committed siblings keep their rows
TEST_F(IngestPipelineTest, PartialFailureKeepsCommittedBatches) {
    MockBatchWriter writer;
    options.batch_size = 10;
    options.max_concurrency = 1;
    EXPECT_CALL(writer, write_batch(_, _, _, _)).Times(AtLeast(1));
    EXPECT_CALL(writer, write_batch(_, _, Field(&BatchSpec::index, 1u), _))
        .WillOnce(Throw(DatabaseError(ErrorCode::COPY_FAILED, "Cell copy failed")));
    BulkIngestionPipeline pipeline(tables, writer, options);

    IngestResult result = pipeline.ingest("alice", "t1", 25);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.batches_committed, 2u);
    EXPECT_EQ(result.batches_failed, 1u);
    EXPECT_EQ(result.rows_added, 15u);  // batches 0 (10) and 2 (5)
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].batch_index, 1u);
    EXPECT_EQ(result.errors[0].rows, 10u);
}

TEST_F(IngestPipelineTest, BulkLoadBracketsTheRun) {
    MockBatchWriter writer;
    ::testing::InSequence seq;
    EXPECT_CALL(writer, begin_bulk_load(300u));
    EXPECT_CALL(writer, write_batch(_, _, _, _)).Times(1);
    EXPECT_CALL(writer, end_bulk_load());
    BulkIngestionPipeline pipeline(tables, writer, options);

    pipeline.ingest("alice", "t1", 100);
}

TEST_F(IngestPipelineTest, BulkLoadEndsEvenWhenBatchesFail) {
    MockBatchWriter writer;
    EXPECT_CALL(writer, begin_bulk_load(_));
    EXPECT_CALL(writer, write_batch(_, _, _, _)).WillRepeatedly(Throw(TransientStoreError("reset")));
    EXPECT_CALL(writer, end_bulk_load()).Times(1);
    BulkIngestionPipeline pipeline(tables, writer, options);

    IngestResult result = pipeline.ingest("alice", "t1", 100);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.rows_added, 0u);
}

TEST_F(IngestPipelineTest, CancelledRunSkipsRemainingBatches) {
    MockBatchWriter writer;
    options.batch_size = 10;
    options.max_concurrency = 1;
    CancellationToken cancel;
    EXPECT_CALL(writer, write_batch(_, _, _, _))
        .WillOnce(Invoke([&](const std::string&, const std::vector<Column>&, const BatchSpec&, uint64_t) {
            cancel.cancel();
        }));
    BulkIngestionPipeline pipeline(tables, writer, options);

    IngestResult result = pipeline.ingest("alice", "t1", 40, {}, &cancel);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.batches_committed, 1u);
    EXPECT_EQ(result.batches_skipped, 3u);
    EXPECT_EQ(result.rows_added, 10u);
}

TEST_F(IngestPipelineTest, ProgressReportsCommittedRows) {
    ConcurrencyTracker writer;
    options.batch_size = 10;
    BulkIngestionPipeline pipeline(tables, writer, options);

    std::mutex m;
    size_t last = 0;
    size_t total_seen = 0;
    pipeline.ingest("alice", "t1", 35, [&](size_t done, size_t total) {
        std::lock_guard<std::mutex> lock(m);
        last = std::max(last, done);
        total_seen = total;
    });
    EXPECT_EQ(last, 35u);
    EXPECT_EQ(total_seen, 35u);
}

TEST_F(IngestPipelineTest, TableWithoutColumnsStillIngests) {
    ON_CALL(tables, load_columns("alice", "empty")).WillByDefault(Return(std::vector<Column>{}));
    MockBatchWriter writer;
    EXPECT_CALL(writer, begin_bulk_load(0u));
    EXPECT_CALL(writer, write_batch("empty", ::testing::IsEmpty(), _, _)).Times(1);
    BulkIngestionPipeline pipeline(tables, writer, options);

    EXPECT_TRUE(pipeline.ingest("alice", "empty", 5).success);
}

// =============================================================================
// Shared index bracket
// =============================================================================

namespace {

// Polls until cond holds or a generous deadline passes.
template <typename Cond>
bool wait_for(Cond cond) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!cond()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace

TEST(BulkLoadGuardTest, SmallLoadsLeaveIndexesAlone) {
    int drops = 0;
    int rebuilds = 0;
    BulkLoadGuard guard(1000, [&]() { ++drops; }, [&]() { ++rebuilds; });

    guard.enter(999);
    EXPECT_FALSE(guard.indexes_dropped());
    guard.leave();
    EXPECT_EQ(drops, 0);
    EXPECT_EQ(rebuilds, 0);

    guard.enter(1000);
    EXPECT_TRUE(guard.indexes_dropped());
    guard.leave();
    EXPECT_EQ(drops, 1);
    EXPECT_EQ(rebuilds, 1);
    EXPECT_EQ(guard.active(), 0u);
}

TEST(BulkLoadGuardTest, UnpairedLeaveIsIgnored) {
    int rebuilds = 0;
    BulkLoadGuard guard(1, {}, [&]() { ++rebuilds; });
    guard.leave();
    EXPECT_EQ(guard.active(), 0u);
    EXPECT_EQ(rebuilds, 0);
}

// Two pipelines share one writer; the first to finish must not rebuild the
// indexes while the other is still writing.
TEST_F(IngestPipelineTest, OverlappingLoadsRebuildIndexesOnce) {
    ON_CALL(tables, load_columns("alice", "t2")).WillByDefault(Return(fakes::sample_columns("t2")));

    std::atomic<int> drops{0};
    std::atomic<int> rebuilds{0};
    BulkLoadGuard guard(100, [&]() { ++drops; }, [&]() { ++rebuilds; });

    MockBatchWriter writer;
    EXPECT_CALL(writer, begin_bulk_load(300u)).Times(2)
        .WillRepeatedly(Invoke(&guard, &BulkLoadGuard::enter));
    EXPECT_CALL(writer, end_bulk_load()).Times(2)
        .WillRepeatedly(Invoke(&guard, &BulkLoadGuard::leave));

    std::atomic<bool> first_done{false};
    std::atomic<int> rebuilds_seen_by_second{-1};
    EXPECT_CALL(writer, write_batch("t1", _, _, _))
        .WillOnce(Invoke([&](const std::string&, const std::vector<Column>&, const BatchSpec&, uint64_t) {
            ASSERT_TRUE(wait_for([&]() { return guard.active() == 2; }));
        }));
    EXPECT_CALL(writer, write_batch("t2", _, _, _))
        .WillOnce(Invoke([&](const std::string&, const std::vector<Column>&, const BatchSpec&, uint64_t) {
            ASSERT_TRUE(wait_for([&]() { return first_done.load(); }));
            rebuilds_seen_by_second = rebuilds.load();
        }));

    BulkIngestionPipeline first(tables, writer, options);
    BulkIngestionPipeline second(tables, writer, options);

    std::thread a([&]() {
        EXPECT_TRUE(first.ingest("alice", "t1", 100).success);
        first_done = true;
    });
    std::thread b([&]() { EXPECT_TRUE(second.ingest("alice", "t2", 100).success); });
    a.join();
    b.join();

    EXPECT_EQ(drops.load(), 1);
    EXPECT_EQ(rebuilds_seen_by_second.load(), 0);
    EXPECT_EQ(rebuilds.load(), 1);
    EXPECT_FALSE(guard.indexes_dropped());
}
