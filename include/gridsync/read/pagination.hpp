#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gridsync/config.hpp"
#include "gridsync/store/table_store.hpp"
#include "gridsync/util/backoff.hpp"

namespace gridsync::read {

// Opaque cursor: hex of "<createdAtMicros>:<id>".
std::string encode_cursor(const RowKey& key);

// nullopt for anything malformed.
std::optional<RowKey> decode_cursor(std::string_view cursor);

struct PageOptions {
    size_t first_page_size = 500;
    size_t max_page_size = 100000;
    RetryPolicy read_retry{std::chrono::milliseconds(100), std::chrono::milliseconds(2000), 3};

    static PageOptions from_config(const Config& config) {
        PageOptions o;
        o.first_page_size = config.get<size_t>("page.first_size", o.first_page_size);
        o.max_page_size = config.get<size_t>("page.max_size", o.max_page_size);
        o.read_retry.max_retries = config.get<int>("page.read_retries", o.read_retry.max_retries);
        return o;
    }
};

struct Page {
    std::vector<Row> rows;
    std::optional<std::string> next_cursor;
    bool has_more = false;
    int64_t total_count = 0;
};

/**
 * Keyset pagination over (createdAt, id).
 *
 * The first page holds first_page_size rows; later pages ask for the whole
 * table count so the remainder arrives in one round trip. N+1 rows are
 * fetched to detect a next page. A malformed cursor reads the first page.
 * TransientStoreError is retried with backoff; other errors propagate.
 */
class PaginationEngine {
public:
    PaginationEngine(store::TableStore& tables, PageOptions options = {})
        : tables_(tables), options_(options) {}

    Page get_page(const std::string& user_id, const std::string& table_id,
                  const std::optional<std::string>& cursor = std::nullopt,
                  std::optional<size_t> limit = std::nullopt);

private:
    template <typename Fn>
    auto with_retry(const char* what, Fn&& fn) -> decltype(fn());

    store::TableStore& tables_;
    PageOptions options_;
};

} // namespace gridsync::read
