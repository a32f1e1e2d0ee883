#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "gridsync/db/operations.hpp"
#include "gridsync/ingest/batch_planner.hpp"
#include "gridsync/types.hpp"

namespace gridsync::ingest {

/**
 * Writes one batch of synthetic rows atomically.
 *
 * write_batch() either commits all `batch.count` rows with their cells or
 * throws after rolling everything back. Called concurrently from pipeline
 * workers, one batch per call.
 */
class BatchWriter {
public:
    virtual ~BatchWriter() = default;

    // Bracket the whole ingestion; total_cells = rows x columns.
    virtual void begin_bulk_load(size_t total_cells) { (void)total_cells; }
    virtual void end_bulk_load() {}

    virtual void write_batch(const std::string& table_id, const std::vector<Column>& columns,
                             const BatchSpec& batch, uint64_t seed) = 0;
};

// =============================================================================
// Line encoding ("Row" and "Cell" COPY streams)
// =============================================================================

// {"<columnId>": value, ...} with an entry (possibly null) for every column.
std::string encode_cache_json(const std::vector<Column>& columns, const RowCache& cache);

// id, tableId, cache, search
std::string encode_row_line(const std::string& row_id, const std::string& table_id,
                            const std::vector<Column>& columns, const RowCache& cache);

// id, rowId, columnId, vText, vNumber
std::string encode_cell_line(const Cell& cell);

extern const std::vector<std::string> kRowCopyColumns;
extern const std::vector<std::string> kCellCopyColumns;

// =============================================================================
// BulkLoadGuard
// =============================================================================

/**
 * Reference-counted index bracket shared by concurrent bulk loads.
 *
 * The first load at or above the threshold runs `drop`; the indexes stay
 * dropped until the last overlapping load leaves, which runs `rebuild`.
 * Every enter() must be paired with one leave(). Actions run under the
 * guard's mutex and must not throw.
 */
class BulkLoadGuard {
public:
    using Action = std::function<void()>;

    BulkLoadGuard(size_t threshold_cells, Action drop, Action rebuild)
        : threshold_(threshold_cells), drop_(std::move(drop)), rebuild_(std::move(rebuild)) {}

    void enter(size_t total_cells);
    void leave();

    size_t active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

    bool indexes_dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    size_t threshold_;
    Action drop_;
    Action rebuild_;
    mutable std::mutex mutex_;
    size_t active_ = 0;
    bool dropped_ = false;
};

// =============================================================================
// StreamingRowWriter
// =============================================================================

/**
 * COPY-based BatchWriter.
 *
 * Per batch, on its own pooled connection and inside one transaction with
 * synchronous_commit off: stream the "Row" lines while collecting row ids,
 * then regenerate the same values from the batch seed and stream the "Cell"
 * lines. Only ids are held in memory.
 *
 * For loads at or above index_drop_cell_threshold cells the Cell secondary
 * indexes are dropped in begin_bulk_load() and rebuilt once the last
 * overlapping load calls end_bulk_load(). One writer may serve concurrent
 * pipelines.
 */
class StreamingRowWriter : public BatchWriter {
public:
    StreamingRowWriter(db::ConnectionPool& pool, size_t index_drop_cell_threshold);

    void begin_bulk_load(size_t total_cells) override;
    void end_bulk_load() override;

    void write_batch(const std::string& table_id, const std::vector<Column>& columns,
                     const BatchSpec& batch, uint64_t seed) override;

    // Total backpressure waits seen by the COPY streams (diagnostics).
    size_t drain_waits() const { return drain_waits_.load(); }

private:
    void drop_indexes();
    void rebuild_indexes();

    db::ConnectionPool& pool_;
    BulkLoadGuard index_guard_;
    std::atomic<size_t> drain_waits_{0};
};

} // namespace gridsync::ingest
