#include "gridsync/db/schema.hpp"

#include "gridsync/db/helpers.hpp"
#include "gridsync/logging.hpp"
#include "gridsync/schema_sql.hpp"

namespace gridsync::db {

void ensure_schema(PGconn* conn) {
    // Multi-statement text: simple query protocol, runs as one implicit transaction.
    Result res = exec(conn, kSchemaSql);
    check(res, conn, "ensure_schema");
    LOG_INFO("Schema ensured");
}

namespace {

bool exec_logged(PGconn* conn, const char* sql, const char* what) {
    Result res = exec(conn, sql);
    if (!res.ok()) {
        LOG_WARN(what, " failed: ", res.error_message());
        return false;
    }
    return true;
}

} // anonymous namespace

bool drop_cell_secondary_indexes(PGconn* conn) {
    bool ok = exec_logged(conn, "DROP INDEX CONCURRENTLY IF EXISTS \"Cell_rowId_idx\"", "drop Cell_rowId_idx");
    ok = exec_logged(conn, "DROP INDEX CONCURRENTLY IF EXISTS \"Cell_columnId_idx\"", "drop Cell_columnId_idx") && ok;
    if (ok) LOG_INFO("Dropped Cell secondary indexes for bulk load");
    return ok;
}

bool create_cell_secondary_indexes(PGconn* conn) {
    bool ok = exec_logged(conn,
        "CREATE INDEX CONCURRENTLY IF NOT EXISTS \"Cell_rowId_idx\" ON \"Cell\" (\"rowId\")",
        "create Cell_rowId_idx");
    ok = exec_logged(conn,
        "CREATE INDEX CONCURRENTLY IF NOT EXISTS \"Cell_columnId_idx\" ON \"Cell\" (\"columnId\")",
        "create Cell_columnId_idx") && ok;
    if (ok) LOG_INFO("Recreated Cell secondary indexes");
    return ok;
}

bool ensure_cell_unique_constraint(PGconn* conn) {
    Result res = exec(conn,
        "SELECT 1 FROM pg_constraint WHERE conname = 'Cell_rowId_columnId_key'");
    if (!res.ok()) {
        LOG_WARN("Cell constraint lookup failed: ", res.error_message());
        return false;
    }
    if (res.has_rows()) return true;

    LOG_WARN("Cell (rowId, columnId) unique constraint missing, re-adding");
    return exec_logged(conn,
        "ALTER TABLE \"Cell\" ADD CONSTRAINT \"Cell_rowId_columnId_key\" UNIQUE (\"rowId\", \"columnId\")",
        "add Cell_rowId_columnId_key");
}

} // namespace gridsync::db
