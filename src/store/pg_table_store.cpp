#include "gridsync/store/pg_table_store.hpp"

#include <boost/json.hpp>

#include "gridsync/logging.hpp"

namespace gridsync::store {

namespace json = boost::json;

namespace {

// Exact microseconds since epoch (EXTRACT(EPOCH) alone loses digits on older servers).
#define GS_CREATED_AT_US(col) \
    "(EXTRACT(EPOCH FROM date_trunc('second', " col "))::bigint * 1000000 + " \
    "(EXTRACT(MICROSECONDS FROM " col ")::bigint % 1000000))"

const char* kOwnedTableSql =
    "SELECT t.id FROM \"Table\" t JOIN \"Base\" b ON b.id = t.\"baseId\" "
    "WHERE t.id = $1 AND b.\"userId\" = $2";

const char* kColumnsSql =
    "SELECT c.id, c.\"tableId\", c.name, c.type FROM \"Column\" c "
    "WHERE c.\"tableId\" = $1 ORDER BY c.\"createdAt\", c.id";

const char* kRowsFirstSql =
    "SELECT r.id, r.\"tableId\", r.cache::text, r.search, " GS_CREATED_AT_US("r.\"createdAt\"") " "
    "FROM \"Row\" r JOIN \"Table\" t ON t.id = r.\"tableId\" JOIN \"Base\" b ON b.id = t.\"baseId\" "
    "WHERE r.\"tableId\" = $1 AND b.\"userId\" = $2 "
    "ORDER BY r.\"createdAt\", r.id LIMIT $3";

const char* kRowsAfterSql =
    "SELECT r.id, r.\"tableId\", r.cache::text, r.search, " GS_CREATED_AT_US("r.\"createdAt\"") " "
    "FROM \"Row\" r JOIN \"Table\" t ON t.id = r.\"tableId\" JOIN \"Base\" b ON b.id = t.\"baseId\" "
    "WHERE r.\"tableId\" = $1 AND b.\"userId\" = $2 "
    "AND (r.\"createdAt\", r.id) > (TIMESTAMPTZ 'epoch' + $3::bigint * INTERVAL '1 microsecond', $4) "
    "ORDER BY r.\"createdAt\", r.id LIMIT $5";

const char* kCountSql =
    "SELECT count(*) FROM \"Row\" WHERE \"tableId\" = $1";

#undef GS_CREATED_AT_US

} // anonymous namespace

void require_table_owner(PGconn* conn, const std::string& user_id, const std::string& table_id) {
    db::Result res = db::exec_checked(conn, kOwnedTableSql, {table_id, user_id}, "require_table_owner");
    if (!res.has_rows()) {
        throw NotFoundError("Table not found", "table " + table_id);
    }
}

RowCache parse_row_cache(const std::string& json_text) {
    RowCache cache;
    json::error_code ec;
    json::value v = json::parse(json_text, ec);
    if (ec || !v.is_object()) {
        LOG_WARN("Ignoring malformed row cache: ", ec ? ec.message() : "not an object");
        return cache;
    }
    for (const auto& kv : v.get_object()) {
        std::string key(kv.key().data(), kv.key().size());
        const json::value& val = kv.value();
        if (val.is_null()) {
            cache[key] = ScalarValue{};
        } else if (val.is_string()) {
            const json::string& s = val.get_string();
            cache[key] = std::string(s.data(), s.size());
        } else if (val.is_int64()) {
            cache[key] = static_cast<double>(val.get_int64());
        } else if (val.is_uint64()) {
            cache[key] = static_cast<double>(val.get_uint64());
        } else if (val.is_double()) {
            cache[key] = val.get_double();
        } else {
            cache[key] = json::serialize(val);
        }
    }
    return cache;
}

std::vector<Column> PgTableStore::load_columns(const std::string& user_id, const std::string& table_id) {
    auto conn = pool_.acquire();
    require_table_owner(conn, user_id, table_id);

    db::Result res = db::exec_checked(conn, kColumnsSql, {table_id}, "load_columns");
    std::vector<Column> columns;
    columns.reserve(res.ntuples());
    for (int i = 0; i < res.ntuples(); ++i) {
        Column col;
        col.id = res.str(i, 0);
        col.table_id = res.str(i, 1);
        col.name = res.str(i, 2);
        auto type = parse_column_type(res.str(i, 3));
        if (!type) {
            LOG_WARN("Column ", col.id, " has unknown type '", res.str(i, 3), "', treating as TEXT");
        }
        col.type = type.value_or(ColumnType::Text);
        columns.push_back(std::move(col));
    }
    return columns;
}

std::vector<Row> PgTableStore::fetch_rows_after(const std::string& user_id, const std::string& table_id,
                                                const std::optional<RowKey>& after, size_t limit) {
    auto conn = pool_.acquire();
    db::Result res = after
        ? db::exec_checked(conn, kRowsAfterSql,
                           {table_id, user_id, std::to_string(after->created_at_us), after->id,
                            std::to_string(limit)},
                           "fetch_rows_after")
        : db::exec_checked(conn, kRowsFirstSql, {table_id, user_id, std::to_string(limit)},
                           "fetch_rows_after");

    std::vector<Row> rows;
    rows.reserve(res.ntuples());
    for (int i = 0; i < res.ntuples(); ++i) {
        Row row;
        row.id = res.str(i, 0);
        row.table_id = res.str(i, 1);
        row.cache = parse_row_cache(res.str(i, 2));
        row.search = res.str(i, 3);
        row.created_at_us = res.int64(i, 4);
        rows.push_back(std::move(row));
    }
    return rows;
}

int64_t PgTableStore::count_rows(const std::string& user_id, const std::string& table_id) {
    auto conn = pool_.acquire();
    require_table_owner(conn, user_id, table_id);
    db::Result res = db::exec_checked(conn, kCountSql, {table_id}, "count_rows");
    return res.int64(0, 0);
}

} // namespace gridsync::store
