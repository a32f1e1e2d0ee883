#pragma once

#include <cstddef>
#include <vector>

namespace gridsync::ingest {

struct BatchSpec {
    size_t index = 0;   // 0-based batch number
    size_t start = 0;   // offset of the first row within the request
    size_t count = 0;
};

struct BatchPlan {
    std::vector<BatchSpec> batches;
    size_t worker_count = 0;
    size_t total_rows = 0;
};

/**
 * Split `count` rows into batches of `batch_size` (the last one holds the
 * remainder) and bound the workers by min(max_concurrency, batches).
 * count == 0 yields an empty plan with no workers.
 */
BatchPlan plan_batches(size_t count, size_t batch_size, size_t max_concurrency);

} // namespace gridsync::ingest
