#include "gridsync/ingest/row_writer.hpp"

#include <boost/json.hpp>

#include "gridsync/db/schema.hpp"
#include "gridsync/ingest/value_synth.hpp"
#include "gridsync/logging.hpp"
#include "gridsync/util/id.hpp"

namespace gridsync::ingest {

namespace json = boost::json;

const std::vector<std::string> kRowCopyColumns = {"id", "\"tableId\"", "cache", "search"};
const std::vector<std::string> kCellCopyColumns = {"id", "\"rowId\"", "\"columnId\"", "\"vText\"", "\"vNumber\""};

std::string encode_cache_json(const std::vector<Column>& columns, const RowCache& cache) {
    json::object obj;
    for (const auto& col : columns) {
        auto it = cache.find(col.id);
        if (it == cache.end() || is_null(it->second)) {
            obj[col.id] = nullptr;
        } else if (const auto* s = std::get_if<std::string>(&it->second)) {
            obj[col.id] = *s;
        } else {
            obj[col.id] = std::get<double>(it->second);
        }
    }
    return json::serialize(obj);
}

std::string encode_row_line(const std::string& row_id, const std::string& table_id,
                            const std::vector<Column>& columns, const RowCache& cache) {
    db::CsvLine line;
    line.text(row_id)
        .text(table_id)
        .text(encode_cache_json(columns, cache))
        .text(build_search_text(columns, cache));
    return line.str();
}

std::string encode_cell_line(const Cell& cell) {
    db::CsvLine line;
    line.text(cell.id).text(cell.row_id).text(cell.column_id);
    if (cell.v_text) line.text(*cell.v_text); else line.null();
    if (cell.v_number) line.number(*cell.v_number); else line.null();
    return line.str();
}

// =============================================================================
// BulkLoadGuard
// =============================================================================

void BulkLoadGuard::enter(size_t total_cells) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++active_;
    if (!dropped_ && total_cells >= threshold_) {
        LOG_INFO("Bulk load of ", total_cells, " cells, dropping Cell secondary indexes");
        dropped_ = true;
        if (drop_) drop_();
    }
}

void BulkLoadGuard::leave() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ == 0) return;
    if (--active_ > 0) {
        if (dropped_) LOG_DEBUG("Index rebuild deferred, ", active_, " bulk loads still running");
        return;
    }
    if (dropped_) {
        dropped_ = false;
        if (rebuild_) rebuild_();
    }
}

// =============================================================================
// StreamingRowWriter
// =============================================================================

StreamingRowWriter::StreamingRowWriter(db::ConnectionPool& pool, size_t index_drop_cell_threshold)
    : pool_(pool),
      index_guard_(index_drop_cell_threshold, [this]() { drop_indexes(); }, [this]() { rebuild_indexes(); }) {}

void StreamingRowWriter::drop_indexes() {
    try {
        auto conn = pool_.acquire();
        db::drop_cell_secondary_indexes(conn);
    } catch (const GridsyncException& e) {
        LOG_WARN("Index drop skipped: ", e.message());
    }
}

void StreamingRowWriter::rebuild_indexes() {
    try {
        auto conn = pool_.acquire();
        db::create_cell_secondary_indexes(conn);
        db::ensure_cell_unique_constraint(conn);
    } catch (const GridsyncException& e) {
        LOG_WARN("Index rebuild failed: ", e.message());
    }
}

void StreamingRowWriter::begin_bulk_load(size_t total_cells) {
    index_guard_.enter(total_cells);
}

void StreamingRowWriter::end_bulk_load() {
    index_guard_.leave();
}

void StreamingRowWriter::write_batch(const std::string& table_id, const std::vector<Column>& columns,
                                     const BatchSpec& batch, uint64_t seed) {
    auto conn = pool_.acquire();
    db::Transaction tx(conn);
    db::Result relaxed = db::exec(conn, "SET LOCAL synchronous_commit = off");
    db::check(relaxed, conn, "write_batch");

    std::vector<std::string> row_ids;
    row_ids.reserve(batch.count);

    {
        db::CopyWriter rows(conn, "\"Row\"", kRowCopyColumns);
        ValueSynth synth(seed);
        for (size_t i = 0; i < batch.count && rows.ok(); ++i) {
            std::string row_id = generate_id();
            RowCache cache;
            for (const auto& col : columns) {
                cache[col.id] = synth.next(col);
            }
            rows.add_line(encode_row_line(row_id, table_id, columns, cache));
            row_ids.push_back(std::move(row_id));
        }
        bool finished = rows.finish();
        drain_waits_ += rows.drain_waits();
        if (!finished) {
            throw DatabaseError(ErrorCode::COPY_FAILED, "Row copy failed: " + rows.error(),
                                "batch " + std::to_string(batch.index));
        }
    }

    if (!columns.empty()) {
        db::CopyWriter cells(conn, "\"Cell\"", kCellCopyColumns);
        ValueSynth synth(seed);
        for (size_t i = 0; i < row_ids.size() && cells.ok(); ++i) {
            for (const auto& col : columns) {
                Cell cell = Cell::make(generate_id(), row_ids[i], col, synth.next(col));
                cells.add_line(encode_cell_line(cell));
            }
        }
        bool finished = cells.finish();
        drain_waits_ += cells.drain_waits();
        if (!finished) {
            throw DatabaseError(ErrorCode::COPY_FAILED, "Cell copy failed: " + cells.error(),
                                "batch " + std::to_string(batch.index));
        }
    }

    tx.commit();
    LOG_DEBUG("Batch ", batch.index, " committed: ", batch.count, " rows, ",
              batch.count * columns.size(), " cells");
}

} // namespace gridsync::ingest
