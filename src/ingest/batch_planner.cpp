#include "gridsync/ingest/batch_planner.hpp"

#include <algorithm>

#include "gridsync/error.hpp"

namespace gridsync::ingest {

BatchPlan plan_batches(size_t count, size_t batch_size, size_t max_concurrency) {
    GRIDSYNC_CHECK_ARGUMENT(batch_size > 0, "batch size must be positive");
    GRIDSYNC_CHECK_ARGUMENT(max_concurrency > 0, "max concurrency must be positive");

    BatchPlan plan;
    plan.total_rows = count;
    if (count == 0) return plan;

    size_t num_batches = (count + batch_size - 1) / batch_size;
    plan.batches.reserve(num_batches);
    for (size_t i = 0; i < num_batches; ++i) {
        size_t start = i * batch_size;
        plan.batches.push_back(BatchSpec{i, start, std::min(batch_size, count - start)});
    }
    plan.worker_count = std::min(max_concurrency, num_batches);
    return plan;
}

} // namespace gridsync::ingest
