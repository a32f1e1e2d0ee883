#include "gridsync/api/table_api.hpp"

#include "gridsync/error.hpp"
#include "gridsync/logging.hpp"

namespace gridsync::api {

ingest::IngestResult TableApi::ingest_rows(const std::string& table_id, int64_t count,
                                           const ingest::ProgressCallback& progress,
                                           const CancellationToken* cancel) {
    return pipeline_.ingest(session_.current_user(), table_id, count, progress, cancel);
}

view::View TableApi::apply_view_patches(const std::string& view_id, int64_t version,
                                        const std::vector<view::Patch>& patches) {
    store::ApplyOutcome outcome = views_.apply_patches(session_.current_user(), view_id, version, patches);
    if (const auto* mismatch = std::get_if<store::VersionMismatch>(&outcome)) {
        throw VersionConflictError(view_id, version, mismatch->current_version);
    }
    return std::get<view::View>(std::move(outcome));
}

read::Page TableApi::get_page(const std::string& table_id, const std::optional<std::string>& cursor,
                              std::optional<size_t> limit) {
    return pages_.get_page(session_.current_user(), table_id, cursor, limit);
}

std::vector<Column> TableApi::columns(const std::string& table_id) {
    return tables_.load_columns(session_.current_user(), table_id);
}

std::vector<view::View> TableApi::list_views(const std::string& table_id) {
    const std::string user = session_.current_user();
    views_.ensure_default_view(user, table_id, tables_.load_columns(user, table_id));
    return views_.list_views(user, table_id);
}

view::View TableApi::create_view(const std::string& table_id, const std::string& name,
                                 const view::ViewConfig& config) {
    return views_.create_view(session_.current_user(), table_id, name, config);
}

void TableApi::delete_view(const std::string& view_id) {
    views_.delete_view(session_.current_user(), view_id);
}

} // namespace gridsync::api
