#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json.hpp>

#include "gridsync/types.hpp"

namespace gridsync::view {

namespace json = boost::json;

// The table's permanent default view. Never deleted; selecting it resets UI state.
inline constexpr std::string_view kDefaultViewName = "Grid view";

inline bool is_default_view(std::string_view name) { return name == kDefaultViewName; }

// =============================================================================
// View configuration
// =============================================================================

enum class FilterLogic { And, Or };

struct FilterCondition {
    std::string column_id;
    std::string op;        // "contains", "equals", "gt", ... (interpreted by the grid)
    json::value value;     // string, number or null

    bool operator==(const FilterCondition& o) const {
        return column_id == o.column_id && op == o.op && value == o.value;
    }
};

struct FilterGroup {
    std::string id;
    FilterLogic logic = FilterLogic::And;
    std::vector<FilterCondition> conditions;

    bool operator==(const FilterGroup& o) const {
        return id == o.id && logic == o.logic && conditions == o.conditions;
    }
};

enum class SortDirection { Asc, Desc };

struct SortSpec {
    std::string column_id;
    SortDirection direction = SortDirection::Asc;

    bool operator==(const SortSpec& o) const {
        return column_id == o.column_id && direction == o.direction;
    }
};

struct ColumnVisibility {
    std::string column_id;
    bool visible = true;
    int order = 0;

    bool operator==(const ColumnVisibility& o) const {
        return column_id == o.column_id && visible == o.visible && order == o.order;
    }
};

struct ViewConfig {
    std::vector<FilterGroup> filters;
    std::vector<SortSpec> sort;
    std::vector<ColumnVisibility> columns;
    std::string search;

    bool operator==(const ViewConfig& o) const {
        return filters == o.filters && sort == o.sort && columns == o.columns && search == o.search;
    }
    bool operator!=(const ViewConfig& o) const { return !(*this == o); }
};

struct View {
    std::string id;
    std::string table_id;
    std::string name;
    ViewConfig config;
    int64_t version = 1;
};

// All columns visible in declaration order, no filters, sort or search.
ViewConfig default_config(const std::vector<Column>& columns);

// =============================================================================
// Patches
// =============================================================================

enum class PatchOp { Set, Merge };
enum class PatchPath { Filters, Sort, Columns, Search };

struct Patch {
    PatchOp op = PatchOp::Set;
    PatchPath path = PatchPath::Search;
    json::value value;
    int64_t timestamp = 0;  // client clock, milliseconds

    bool operator==(const Patch& o) const {
        return op == o.op && path == o.path && value == o.value && timestamp == o.timestamp;
    }
};

const char* patch_op_str(PatchOp op);
const char* patch_path_str(PatchPath path);

// Throw ValidationError for unknown names.
PatchOp parse_patch_op(std::string_view s);
PatchPath parse_patch_path(std::string_view s);

/**
 * Upsert incoming groups by id: existing groups keep their position and are
 * replaced in place, new ids are appended. An empty incoming list clears all.
 */
std::vector<FilterGroup> merge_filters(const std::vector<FilterGroup>& existing,
                                       const std::vector<FilterGroup>& incoming);

/**
 * Apply one patch. `set` replaces the path; `merge` upserts filter groups by
 * id and behaves as `set` on every other path.
 * Throws ValidationError if the value does not have the path's shape.
 */
void apply_patch(ViewConfig& config, const Patch& patch);

// =============================================================================
// JSON codecs
// =============================================================================

json::value filters_to_json(const std::vector<FilterGroup>& filters);
json::value sort_to_json(const std::vector<SortSpec>& sort);
json::value columns_to_json(const std::vector<ColumnVisibility>& columns);

// Throw ValidationError on malformed input.
std::vector<FilterGroup> filters_from_json(const json::value& v);
std::vector<SortSpec> sort_from_json(const json::value& v);
std::vector<ColumnVisibility> columns_from_json(const json::value& v);

json::object config_to_json(const ViewConfig& config);
ViewConfig config_from_json(const json::value& v);

json::object view_to_json(const View& view);

json::object patch_to_json(const Patch& patch);
Patch patch_from_json(const json::value& v);

} // namespace gridsync::view
