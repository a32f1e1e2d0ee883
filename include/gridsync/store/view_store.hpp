#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "gridsync/types.hpp"
#include "gridsync/view/view_model.hpp"

namespace gridsync::store {

// The expected version did not match; carries what the server has.
struct VersionMismatch {
    int64_t current_version = 0;
};

using ApplyOutcome = std::variant<view::View, VersionMismatch>;

/**
 * Server-held view records. Owner-scoped like TableStore.
 */
class ViewStore {
public:
    virtual ~ViewStore() = default;

    virtual std::vector<view::View> list_views(const std::string& user_id, const std::string& table_id) = 0;

    virtual view::View get_view(const std::string& user_id, const std::string& view_id) = 0;

    /**
     * Apply patches in order if the stored version equals expected_version.
     * On success the version advances by exactly one.
     */
    virtual ApplyOutcome apply_patches(const std::string& user_id, const std::string& view_id,
                                       int64_t expected_version,
                                       const std::vector<view::Patch>& patches) = 0;

    // Name must be 1..100 characters (ValidationError).
    virtual view::View create_view(const std::string& user_id, const std::string& table_id,
                                   const std::string& name, const view::ViewConfig& config) = 0;

    // ValidationError for the default view.
    virtual void delete_view(const std::string& user_id, const std::string& view_id) = 0;

    // Returns the table's "Grid view", creating it with all columns visible if missing.
    virtual view::View ensure_default_view(const std::string& user_id, const std::string& table_id,
                                           const std::vector<Column>& columns) = 0;
};

// Shared name rule for view creation.
void validate_view_name(const std::string& name);

} // namespace gridsync::store
