// =============================================================================
// Keyset Pagination Tests
// =============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <set>
#include <thread>

#include "gridsync/error.hpp"
#include "gridsync/read/pagination.hpp"
#include "test_support.hpp"

using namespace gridsync;
using namespace gridsync::read;
using gridsync::fakes::InMemoryTableStore;

class PaginationTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.add_table("t1", "alice", fakes::sample_columns("t1"));
        options.read_retry = RetryPolicy{std::chrono::milliseconds(1), std::chrono::milliseconds(2), 3};
    }

    void fill(int n) {
        for (int i = 0; i < n; ++i) store.append_row("t1", "r" + std::to_string(i));
    }

    InMemoryTableStore store;
    PageOptions options;
};

// =============================================================================
// Cursor codec
// =============================================================================

TEST_F(PaginationTest, CursorRoundTrip) {
    RowKey key{1700000000123456, "cabc123"};
    auto decoded = decode_cursor(encode_cursor(key));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, key);
}

TEST_F(PaginationTest, CursorIsOpaqueHex) {
    std::string c = encode_cursor(RowKey{5, "id"});
    EXPECT_EQ(c.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(PaginationTest, MalformedCursorsDecodeToNothing) {
    EXPECT_FALSE(decode_cursor("").has_value());
    EXPECT_FALSE(decode_cursor("abc").has_value());           // odd length
    EXPECT_FALSE(decode_cursor("zz").has_value());            // not hex
    EXPECT_FALSE(decode_cursor("3132").has_value());          // "12", no separator
    EXPECT_FALSE(decode_cursor("3a6964").has_value());        // ":id", no time
    EXPECT_FALSE(decode_cursor("31323a").has_value());        // "12:", no id
    EXPECT_FALSE(decode_cursor("31783a6964").has_value());    // "1x:id"
}

// =============================================================================
// Paging
// =============================================================================

TEST_F(PaginationTest, FirstPageIsFixedSize) {
    fill(1200);
    PaginationEngine engine(store, options);

    Page page = engine.get_page("alice", "t1");
    EXPECT_EQ(page.rows.size(), 500u);
    EXPECT_TRUE(page.has_more);
    ASSERT_TRUE(page.next_cursor.has_value());
    EXPECT_EQ(page.total_count, 1200);
    EXPECT_EQ(*page.next_cursor, encode_cursor(key_of(page.rows.back())));
}

TEST_F(PaginationTest, SecondPageFetchesTheRemainder) {
    fill(1200);
    PaginationEngine engine(store, options);

    Page first = engine.get_page("alice", "t1");
    Page second = engine.get_page("alice", "t1", first.next_cursor);

    EXPECT_EQ(second.rows.size(), 700u);
    EXPECT_FALSE(second.has_more);
    EXPECT_FALSE(second.next_cursor.has_value());
    EXPECT_EQ(second.rows.front().id, "r500");
}

TEST_F(PaginationTest, ExactFitHasNoNextPage) {
    fill(500);
    PaginationEngine engine(store, options);
    Page page = engine.get_page("alice", "t1");
    EXPECT_EQ(page.rows.size(), 500u);
    EXPECT_FALSE(page.has_more);
    EXPECT_FALSE(page.next_cursor.has_value());
}

TEST_F(PaginationTest, ExplicitLimit) {
    fill(30);
    PaginationEngine engine(store, options);
    Page page = engine.get_page("alice", "t1", std::nullopt, 10);
    EXPECT_EQ(page.rows.size(), 10u);
    EXPECT_TRUE(page.has_more);
}

TEST_F(PaginationTest, LimitClampedToMaximum) {
    fill(30);
    options.max_page_size = 8;
    PaginationEngine engine(store, options);
    Page page = engine.get_page("alice", "t1", std::nullopt, 1000);
    EXPECT_EQ(page.rows.size(), 8u);
}

TEST_F(PaginationTest, MalformedCursorReadsFirstPage) {
    fill(20);
    PaginationEngine engine(store, options);
    Page page = engine.get_page("alice", "t1", std::string("not-a-cursor"));
    ASSERT_FALSE(page.rows.empty());
    EXPECT_EQ(page.rows.front().id, "r0");
}

TEST_F(PaginationTest, EmptyTable) {
    PaginationEngine engine(store, options);
    Page page = engine.get_page("alice", "t1");
    EXPECT_TRUE(page.rows.empty());
    EXPECT_FALSE(page.has_more);
    EXPECT_EQ(page.total_count, 0);
}

TEST_F(PaginationTest, TiesOnCreatedAtBreakById) {
    store.append_row_at("t1", "b", 100);
    store.append_row_at("t1", "a", 100);
    store.append_row_at("t1", "c", 100);
    PaginationEngine engine(store, options);

    Page first = engine.get_page("alice", "t1", std::nullopt, 2);
    ASSERT_EQ(first.rows.size(), 2u);
    EXPECT_EQ(first.rows[0].id, "a");
    EXPECT_EQ(first.rows[1].id, "b");

    Page second = engine.get_page("alice", "t1", first.next_cursor, 2);
    ASSERT_EQ(second.rows.size(), 1u);
    EXPECT_EQ(second.rows[0].id, "c");
}

TEST_F(PaginationTest, ForeignTableIsNotFound) {
    fill(5);
    PaginationEngine engine(store, options);
    EXPECT_THROW(engine.get_page("mallory", "t1"), NotFoundError);
    EXPECT_THROW(engine.get_page("alice", "missing"), NotFoundError);
}

TEST_F(PaginationTest, TransientReadsAreRetried) {
    fill(5);
    store.fail_next_reads(2);
    PaginationEngine engine(store, options);
    Page page = engine.get_page("alice", "t1");
    EXPECT_EQ(page.rows.size(), 5u);
}

TEST_F(PaginationTest, TransientReadsGiveUpAfterRetries) {
    fill(5);
    store.fail_next_reads(10);
    PaginationEngine engine(store, options);
    EXPECT_THROW(engine.get_page("alice", "t1"), TransientStoreError);
}

// Every row present before the first call is seen exactly once, even while
// another writer keeps appending.
TEST_F(PaginationTest, CompleteUnderConcurrentWrites) {
    fill(2000);
    std::set<std::string> before;
    for (int i = 0; i < 2000; ++i) before.insert("r" + std::to_string(i));

    std::atomic<bool> stop{false};
    std::thread writer([&]() {
        int n = 0;
        while (!stop.load()) {
            store.append_row("t1", "w" + std::to_string(n++));
            if (n % 50 == 0) std::this_thread::yield();
        }
    });

    PaginationEngine engine(store, options);
    std::set<std::string> seen;
    size_t duplicates = 0;
    std::optional<std::string> cursor;
    for (int pages = 0; pages < 50; ++pages) {
        Page page = engine.get_page("alice", "t1", cursor, 300);
        for (const auto& row : page.rows) {
            if (!seen.insert(row.id).second) ++duplicates;
        }
        if (!page.has_more) break;
        cursor = page.next_cursor;
    }
    stop.store(true);
    writer.join();

    EXPECT_EQ(duplicates, 0u);
    for (const auto& id : before) {
        EXPECT_TRUE(seen.count(id)) << "missing " << id;
    }
}
