#include "gridsync/ingest/pipeline.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <random>
#include <thread>

#include "gridsync/ingest/batch_planner.hpp"
#include "gridsync/ingest/value_synth.hpp"
#include "gridsync/logging.hpp"

namespace gridsync::ingest {

namespace {

// Calls end_bulk_load() however the batches finish.
class BulkLoadScope {
public:
    BulkLoadScope(BatchWriter& writer, size_t total_cells) : writer_(writer) {
        writer_.begin_bulk_load(total_cells);
    }
    ~BulkLoadScope() { writer_.end_bulk_load(); }

    BulkLoadScope(const BulkLoadScope&) = delete;
    BulkLoadScope& operator=(const BulkLoadScope&) = delete;

private:
    BatchWriter& writer_;
};

} // anonymous namespace

IngestResult BulkIngestionPipeline::ingest(const std::string& user_id, const std::string& table_id,
                                           int64_t count, const ProgressCallback& progress,
                                           const CancellationToken* cancel) {
    IngestResult result;
    if (count == 0) {
        result.success = true;
        return result;
    }
    if (count < 0 || static_cast<uint64_t>(count) > options_.max_rows) {
        throw ValidationError("Row count must be between 1 and " + std::to_string(options_.max_rows),
                              "ingest " + std::to_string(count));
    }

    const std::vector<Column> columns = tables_.load_columns(user_id, table_id);
    const BatchPlan plan = plan_batches(static_cast<size_t>(count), options_.batch_size,
                                        options_.max_concurrency);
    const size_t total_cells = plan.total_rows * columns.size();

    LOG_INFO("Ingesting ", plan.total_rows, " rows into ", table_id, ": ", plan.batches.size(),
             " batches, ", plan.worker_count, " workers, ", columns.size(), " columns, ",
             total_cells, " cells");

    const uint64_t base_seed = std::random_device{}();
    auto start = std::chrono::steady_clock::now();

    ProgressTracker tracker(plan.total_rows, progress);
    std::atomic<size_t> next_batch{0};
    std::mutex result_mutex;

    auto worker = [&]() {
        while (true) {
            size_t idx = next_batch.fetch_add(1);
            if (idx >= plan.batches.size()) break;
            const BatchSpec& batch = plan.batches[idx];

            if (cancel && cancel->is_cancelled()) {
                std::lock_guard<std::mutex> lock(result_mutex);
                result.batches_skipped++;
                continue;
            }

            try {
                writer_.write_batch(table_id, columns, batch, batch_seed(base_seed, batch.index));
                {
                    std::lock_guard<std::mutex> lock(result_mutex);
                    result.rows_added += batch.count;
                    result.batches_committed++;
                }
                tracker.add(batch.count);
            } catch (const std::exception& e) {
                LOG_ERROR("Batch ", batch.index, " (", batch.count, " rows) failed: ", e.what());
                std::lock_guard<std::mutex> lock(result_mutex);
                result.batches_failed++;
                result.errors.push_back(BatchError{batch.index, batch.count, e.what()});
            }
        }
    };

    {
        BulkLoadScope scope(writer_, total_cells);
        std::vector<std::thread> workers;
        workers.reserve(plan.worker_count);
        for (size_t t = 0; t < plan.worker_count; ++t) {
            workers.emplace_back(worker);
        }
        for (auto& th : workers) {
            th.join();
        }
    }

    result.success = result.batches_failed == 0 && result.batches_skipped == 0;

    auto secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (result.success) {
        LOG_INFO("Ingested ", result.rows_added, " rows in ", secs, "s");
    } else {
        LOG_WARN("Ingestion incomplete: ", result.rows_added, "/", plan.total_rows, " rows, ",
                 result.batches_failed, " failed, ", result.batches_skipped, " skipped batches (",
                 secs, "s)");
    }
    return result;
}

} // namespace gridsync::ingest
