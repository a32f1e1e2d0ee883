#pragma once

#include "gridsync/db/operations.hpp"
#include "gridsync/store/table_store.hpp"

namespace gridsync::store {

class PgTableStore : public TableStore {
public:
    explicit PgTableStore(db::ConnectionPool& pool) : pool_(pool) {}

    std::vector<Column> load_columns(const std::string& user_id, const std::string& table_id) override;
    std::vector<Row> fetch_rows_after(const std::string& user_id, const std::string& table_id,
                                      const std::optional<RowKey>& after, size_t limit) override;
    int64_t count_rows(const std::string& user_id, const std::string& table_id) override;

private:
    db::ConnectionPool& pool_;
};

// Parse a "Row".cache jsonb text into a RowCache. Non-scalar entries are kept as their JSON text.
RowCache parse_row_cache(const std::string& json_text);

// Throws NotFoundError unless user_id owns table_id.
void require_table_owner(PGconn* conn, const std::string& user_id, const std::string& table_id);

} // namespace gridsync::store
