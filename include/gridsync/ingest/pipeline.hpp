#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "gridsync/config.hpp"
#include "gridsync/ingest/row_writer.hpp"
#include "gridsync/store/table_store.hpp"
#include "gridsync/util/threading.hpp"

namespace gridsync::ingest {

struct IngestOptions {
    size_t batch_size = 35000;
    size_t max_concurrency = 2;
    size_t max_rows = 100000;

    static IngestOptions from_config(const Config& config) {
        IngestOptions o;
        o.batch_size = config.get<size_t>("ingest.batch_size", o.batch_size);
        o.max_concurrency = config.get<size_t>("ingest.max_concurrency", o.max_concurrency);
        o.max_rows = config.get<size_t>("ingest.max_rows", o.max_rows);
        return o;
    }
};

struct BatchError {
    size_t batch_index = 0;
    size_t rows = 0;
    std::string message;
};

struct IngestResult {
    bool success = false;
    size_t rows_added = 0;          // rows of committed batches
    size_t batches_committed = 0;
    size_t batches_failed = 0;
    size_t batches_skipped = 0;     // not started because of cancellation
    std::vector<BatchError> errors;
};

using ProgressCallback = std::function<void(size_t rows_done, size_t rows_total)>;

/**
 * Populates a table with synthetic rows in independent batches.
 *
 * Columns are loaded once and shared read-only by all workers. Each worker
 * claims the next unstarted batch and hands it to the BatchWriter; a failed
 * batch is rolled back by the writer and recorded, sibling batches keep
 * their commits.
 */
class BulkIngestionPipeline {
public:
    BulkIngestionPipeline(store::TableStore& tables, BatchWriter& writer, IngestOptions options = {})
        : tables_(tables), writer_(writer), options_(options) {}

    /**
     * count == 0 returns success without touching storage.
     * Throws ValidationError for count < 0 or > max_rows, NotFoundError for
     * an unknown or foreign table.
     */
    IngestResult ingest(const std::string& user_id, const std::string& table_id, int64_t count,
                        const ProgressCallback& progress = {},
                        const CancellationToken* cancel = nullptr);

    const IngestOptions& options() const { return options_; }

private:
    store::TableStore& tables_;
    BatchWriter& writer_;
    IngestOptions options_;
};

} // namespace gridsync::ingest
