#pragma once

#include <libpq-fe.h>

namespace gridsync::db {

// Apply sql/schema.sql. Idempotent. Throws DatabaseError on failure.
void ensure_schema(PGconn* conn);

// =============================================================================
// Cell index maintenance for very large loads
// =============================================================================
//
// Secondary indexes on "Cell" ("rowId", "columnId") slow COPY down a lot once a
// load reaches millions of cells. The primary key and the (rowId, columnId)
// unique constraint are never dropped. Drops and rebuilds run CONCURRENTLY, so
// they need an idle connection outside any transaction and never block reads
// of "Cell". None of these throw; failures are logged.

bool drop_cell_secondary_indexes(PGconn* conn);
bool create_cell_secondary_indexes(PGconn* conn);

// Re-adds the (rowId, columnId) unique constraint if something removed it.
bool ensure_cell_unique_constraint(PGconn* conn);

} // namespace gridsync::db
