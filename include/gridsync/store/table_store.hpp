#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gridsync/types.hpp"

namespace gridsync::store {

/**
 * Row/column access for one owner.
 *
 * Every call is scoped to user_id; a table the user does not own is
 * reported as NotFoundError, exactly like a missing one.
 */
class TableStore {
public:
    virtual ~TableStore() = default;

    // Columns in creation order.
    virtual std::vector<Column> load_columns(const std::string& user_id, const std::string& table_id) = 0;

    // Up to `limit` rows with (createdAt, id) strictly greater than `after`, ascending.
    virtual std::vector<Row> fetch_rows_after(const std::string& user_id, const std::string& table_id,
                                              const std::optional<RowKey>& after, size_t limit) = 0;

    virtual int64_t count_rows(const std::string& user_id, const std::string& table_id) = 0;
};

} // namespace gridsync::store
