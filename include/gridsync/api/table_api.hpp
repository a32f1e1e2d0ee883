#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gridsync/ingest/pipeline.hpp"
#include "gridsync/read/pagination.hpp"
#include "gridsync/store/session.hpp"
#include "gridsync/store/table_store.hpp"
#include "gridsync/store/view_store.hpp"

namespace gridsync::api {

/**
 * Server-side entry points used by the UI layer and the CLI.
 * Every call acts as SessionResolver::current_user().
 */
class TableApi {
public:
    TableApi(store::SessionResolver& session, store::TableStore& tables, store::ViewStore& views,
             ingest::BulkIngestionPipeline& pipeline, read::PaginationEngine& pages)
        : session_(session), tables_(tables), views_(views), pipeline_(pipeline), pages_(pages) {}

    // Long-running; progress is reported per committed batch.
    ingest::IngestResult ingest_rows(const std::string& table_id, int64_t count,
                                     const ingest::ProgressCallback& progress = {},
                                     const CancellationToken* cancel = nullptr);

    // Throws VersionConflictError (with the server's version) on mismatch.
    view::View apply_view_patches(const std::string& view_id, int64_t version,
                                  const std::vector<view::Patch>& patches);

    read::Page get_page(const std::string& table_id,
                        const std::optional<std::string>& cursor = std::nullopt,
                        std::optional<size_t> limit = std::nullopt);

    std::vector<Column> columns(const std::string& table_id);

    // Bootstraps the default view first.
    std::vector<view::View> list_views(const std::string& table_id);

    view::View create_view(const std::string& table_id, const std::string& name,
                           const view::ViewConfig& config);

    void delete_view(const std::string& view_id);

private:
    store::SessionResolver& session_;
    store::TableStore& tables_;
    store::ViewStore& views_;
    ingest::BulkIngestionPipeline& pipeline_;
    read::PaginationEngine& pages_;
};

} // namespace gridsync::api
