#pragma once

#include "gridsync/db/operations.hpp"
#include "gridsync/store/view_store.hpp"

namespace gridsync::store {

class PgViewStore : public ViewStore {
public:
    explicit PgViewStore(db::ConnectionPool& pool) : pool_(pool) {}

    std::vector<view::View> list_views(const std::string& user_id, const std::string& table_id) override;
    view::View get_view(const std::string& user_id, const std::string& view_id) override;
    ApplyOutcome apply_patches(const std::string& user_id, const std::string& view_id,
                               int64_t expected_version,
                               const std::vector<view::Patch>& patches) override;
    view::View create_view(const std::string& user_id, const std::string& table_id,
                           const std::string& name, const view::ViewConfig& config) override;
    void delete_view(const std::string& user_id, const std::string& view_id) override;
    view::View ensure_default_view(const std::string& user_id, const std::string& table_id,
                                   const std::vector<Column>& columns) override;

private:
    db::ConnectionPool& pool_;
};

} // namespace gridsync::store
