#include "gridsync/store/pg_view_store.hpp"

#include <optional>

#include "gridsync/logging.hpp"
#include "gridsync/store/pg_table_store.hpp"
#include "gridsync/util/id.hpp"

namespace gridsync::store {

namespace json = boost::json;

namespace {

// Column list shared by every SELECT below; see view_from_result().
#define GS_VIEW_COLUMNS \
    "v.id, v.\"tableId\", v.name, v.filters::text, v.sort::text, v.columns::text, v.search, v.version"

#define GS_VIEW_OWNED_FROM \
    " FROM \"View\" v JOIN \"Table\" t ON t.id = v.\"tableId\" JOIN \"Base\" b ON b.id = t.\"baseId\" "

const char* kListSql =
    "SELECT " GS_VIEW_COLUMNS GS_VIEW_OWNED_FROM
    "WHERE v.\"tableId\" = $1 AND b.\"userId\" = $2 ORDER BY v.\"createdAt\", v.id";

const char* kGetSql =
    "SELECT " GS_VIEW_COLUMNS GS_VIEW_OWNED_FROM
    "WHERE v.id = $1 AND b.\"userId\" = $2";

const char* kLockSql =
    "SELECT " GS_VIEW_COLUMNS GS_VIEW_OWNED_FROM
    "WHERE v.id = $1 AND b.\"userId\" = $2 FOR UPDATE OF v";

const char* kUpdateSql =
    "UPDATE \"View\" SET filters = $2::jsonb, sort = $3::jsonb, columns = $4::jsonb, search = $5, "
    "version = version + 1, \"updatedAt\" = now() WHERE id = $1 RETURNING version";

const char* kInsertSql =
    "INSERT INTO \"View\" (id, \"tableId\", name, filters, sort, columns, search, version) "
    "VALUES ($1, $2, $3, $4::jsonb, $5::jsonb, $6::jsonb, $7, 1)";

// Loses to a concurrent bootstrap without error; the caller re-selects.
const char* kInsertDefaultSql =
    "INSERT INTO \"View\" (id, \"tableId\", name, filters, sort, columns, search, version) "
    "VALUES ($1, $2, $3, $4::jsonb, $5::jsonb, $6::jsonb, $7, 1) "
    "ON CONFLICT (\"tableId\") WHERE name = 'Grid view' DO NOTHING";

const char* kDeleteSql = "DELETE FROM \"View\" WHERE id = $1";

#undef GS_VIEW_COLUMNS
#undef GS_VIEW_OWNED_FROM

json::value parse_or_null(const std::string& text) {
    json::error_code ec;
    json::value v = json::parse(text, ec);
    if (ec) {
        LOG_WARN("Ignoring malformed view JSON: ", ec.message());
        return nullptr;
    }
    return v;
}

view::View view_from_result(const db::Result& res, int row) {
    view::View v;
    v.id = res.str(row, 0);
    v.table_id = res.str(row, 1);
    v.name = res.str(row, 2);
    v.config.filters = view::filters_from_json(parse_or_null(res.str(row, 3)));
    v.config.sort = view::sort_from_json(parse_or_null(res.str(row, 4)));
    v.config.columns = view::columns_from_json(parse_or_null(res.str(row, 5)));
    v.config.search = res.str(row, 6);
    v.version = res.int64(row, 7, 1);
    return v;
}

db::Params config_params(const view::ViewConfig& config) {
    return {json::serialize(view::filters_to_json(config.filters)),
            json::serialize(view::sort_to_json(config.sort)),
            json::serialize(view::columns_to_json(config.columns)),
            config.search};
}

} // anonymous namespace

std::vector<view::View> PgViewStore::list_views(const std::string& user_id, const std::string& table_id) {
    auto conn = pool_.acquire();
    require_table_owner(conn, user_id, table_id);

    db::Result res = db::exec_checked(conn, kListSql, {table_id, user_id}, "list_views");
    std::vector<view::View> views;
    views.reserve(res.ntuples());
    for (int i = 0; i < res.ntuples(); ++i) {
        views.push_back(view_from_result(res, i));
    }
    return views;
}

view::View PgViewStore::get_view(const std::string& user_id, const std::string& view_id) {
    auto conn = pool_.acquire();
    db::Result res = db::exec_checked(conn, kGetSql, {view_id, user_id}, "get_view");
    if (!res.has_rows()) {
        throw NotFoundError("View not found", "view " + view_id);
    }
    return view_from_result(res, 0);
}

ApplyOutcome PgViewStore::apply_patches(const std::string& user_id, const std::string& view_id,
                                        int64_t expected_version,
                                        const std::vector<view::Patch>& patches) {
    auto conn = pool_.acquire();
    db::Transaction tx(conn);

    db::Result locked = db::exec_checked(conn, kLockSql, {view_id, user_id}, "apply_patches");
    if (!locked.has_rows()) {
        throw NotFoundError("View not found", "view " + view_id);
    }
    view::View v = view_from_result(locked, 0);
    if (v.version != expected_version) {
        LOG_DEBUG("View ", view_id, " version mismatch: expected ", expected_version, ", have ", v.version);
        return VersionMismatch{v.version};
    }

    for (const auto& patch : patches) {
        view::apply_patch(v.config, patch);
    }

    db::Params params = config_params(v.config);
    params.insert(params.begin(), std::optional<std::string>(view_id));
    db::Result updated = db::exec_checked(conn, kUpdateSql, params, "apply_patches");
    v.version = updated.int64(0, 0, v.version + 1);
    tx.commit();

    LOG_DEBUG("View ", view_id, " patched (", patches.size(), " patches) -> version ", v.version);
    return v;
}

view::View PgViewStore::create_view(const std::string& user_id, const std::string& table_id,
                                    const std::string& name, const view::ViewConfig& config) {
    validate_view_name(name);
    if (view::is_default_view(name)) {
        throw ValidationError("View name is reserved for the default view", "table " + table_id);
    }

    auto conn = pool_.acquire();
    require_table_owner(conn, user_id, table_id);

    view::View v;
    v.id = generate_id();
    v.table_id = table_id;
    v.name = name;
    v.config = config;
    v.version = 1;

    db::Params params = config_params(config);
    params.insert(params.begin(), {v.id, table_id, name});
    db::exec_checked(conn, kInsertSql, params, "create_view");

    LOG_INFO("Created view '", name, "' (", v.id, ") on table ", table_id);
    return v;
}

void PgViewStore::delete_view(const std::string& user_id, const std::string& view_id) {
    auto conn = pool_.acquire();
    db::Transaction tx(conn);

    // Row lock serializes concurrent deletes and patches of the same view.
    db::Result locked = db::exec_checked(conn, kLockSql, {view_id, user_id}, "delete_view");
    if (!locked.has_rows()) {
        throw NotFoundError("View not found", "view " + view_id);
    }
    view::View v = view_from_result(locked, 0);
    if (view::is_default_view(v.name)) {
        throw ValidationError("Cannot delete the default view", "view " + view_id);
    }

    db::Result deleted = db::exec_checked(conn, kDeleteSql, {view_id}, "delete_view");
    if (db::cmd_tuples(deleted) == 0) {
        throw NotFoundError("View not found", "view " + view_id);
    }
    tx.commit();
    LOG_INFO("Deleted view '", v.name, "' (", view_id, ")");
}

view::View PgViewStore::ensure_default_view(const std::string& user_id, const std::string& table_id,
                                            const std::vector<Column>& columns) {
    auto find_default = [&]() -> std::optional<view::View> {
        for (auto& v : list_views(user_id, table_id)) {
            if (view::is_default_view(v.name)) return std::move(v);
        }
        return std::nullopt;
    };

    if (auto existing = find_default()) return std::move(*existing);

    {
        auto conn = pool_.acquire();
        db::Params params = config_params(view::default_config(columns));
        params.insert(params.begin(), {generate_id(), table_id, std::string(view::kDefaultViewName)});
        db::Result res = db::exec_checked(conn, kInsertDefaultSql, params, "ensure_default_view");
        if (db::cmd_tuples(res) > 0) {
            LOG_INFO("Created default view on table ", table_id);
        }
    }

    if (auto created = find_default()) return std::move(*created);
    throw DatabaseError("Default view missing after insert", "table " + table_id);
}

} // namespace gridsync::store
