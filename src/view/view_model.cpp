#include "gridsync/view/view_model.hpp"

#include <algorithm>

#include "gridsync/error.hpp"

namespace gridsync::view {

namespace {

const json::object& expect_object(const json::value& v, const char* what) {
    if (!v.is_object()) {
        throw ValidationError(std::string(what) + " must be an object");
    }
    return v.get_object();
}

const json::array& expect_array(const json::value& v, const char* what) {
    if (!v.is_array()) {
        throw ValidationError(std::string(what) + " must be an array");
    }
    return v.get_array();
}

std::string string_field(const json::object& o, const char* key, const char* what) {
    auto it = o.find(key);
    if (it == o.end() || !it->value().is_string()) {
        throw ValidationError(std::string(what) + "." + key + " must be a string");
    }
    const json::string& s = it->value().get_string();
    return std::string(s.data(), s.size());
}

json::value scalar_field(const json::object& o, const char* key) {
    auto it = o.find(key);
    if (it == o.end()) return nullptr;
    const json::value& v = it->value();
    if (v.is_string() || v.is_number() || v.is_null() || v.is_bool()) return v;
    throw ValidationError(std::string("filter condition ") + key + " must be a scalar");
}

} // anonymous namespace

ViewConfig default_config(const std::vector<Column>& columns) {
    ViewConfig config;
    config.columns.reserve(columns.size());
    int order = 0;
    for (const auto& col : columns) {
        config.columns.push_back(ColumnVisibility{col.id, true, order++});
    }
    return config;
}

// =============================================================================
// Patch names
// =============================================================================

const char* patch_op_str(PatchOp op) {
    return op == PatchOp::Merge ? "merge" : "set";
}

const char* patch_path_str(PatchPath path) {
    switch (path) {
        case PatchPath::Filters: return "filters";
        case PatchPath::Sort:    return "sort";
        case PatchPath::Columns: return "columns";
        case PatchPath::Search:  return "search";
    }
    return "search";
}

PatchOp parse_patch_op(std::string_view s) {
    if (s == "set") return PatchOp::Set;
    if (s == "merge") return PatchOp::Merge;
    throw ValidationError("unknown patch operation '" + std::string(s) + "'");
}

PatchPath parse_patch_path(std::string_view s) {
    if (s == "filters") return PatchPath::Filters;
    if (s == "sort") return PatchPath::Sort;
    if (s == "columns") return PatchPath::Columns;
    if (s == "search") return PatchPath::Search;
    throw ValidationError("unknown patch path '" + std::string(s) + "'");
}

// =============================================================================
// Patch application
// =============================================================================

std::vector<FilterGroup> merge_filters(const std::vector<FilterGroup>& existing,
                                       const std::vector<FilterGroup>& incoming) {
    if (incoming.empty()) return {};

    std::vector<FilterGroup> merged = existing;
    for (const auto& group : incoming) {
        auto it = std::find_if(merged.begin(), merged.end(),
                               [&](const FilterGroup& g) { return g.id == group.id; });
        if (it != merged.end()) {
            *it = group;
        } else {
            merged.push_back(group);
        }
    }
    return merged;
}

void apply_patch(ViewConfig& config, const Patch& patch) {
    switch (patch.path) {
        case PatchPath::Filters: {
            auto incoming = filters_from_json(patch.value);
            if (patch.op == PatchOp::Merge) {
                config.filters = merge_filters(config.filters, incoming);
            } else {
                config.filters = std::move(incoming);
            }
            break;
        }
        case PatchPath::Sort:
            config.sort = sort_from_json(patch.value);
            break;
        case PatchPath::Columns:
            config.columns = columns_from_json(patch.value);
            break;
        case PatchPath::Search:
            if (patch.value.is_null()) {
                config.search.clear();
            } else if (patch.value.is_string()) {
                const json::string& s = patch.value.get_string();
                config.search.assign(s.data(), s.size());
            } else {
                throw ValidationError("search must be a string");
            }
            break;
    }
}

// =============================================================================
// JSON codecs
// =============================================================================

json::value filters_to_json(const std::vector<FilterGroup>& filters) {
    json::array arr;
    for (const auto& group : filters) {
        json::array conditions;
        for (const auto& c : group.conditions) {
            json::object cond;
            cond["columnId"] = c.column_id;
            cond["operator"] = c.op;
            cond["value"] = c.value;
            conditions.push_back(std::move(cond));
        }
        json::object g;
        g["id"] = group.id;
        g["logic"] = group.logic == FilterLogic::Or ? "OR" : "AND";
        g["conditions"] = std::move(conditions);
        arr.push_back(std::move(g));
    }
    return arr;
}

json::value sort_to_json(const std::vector<SortSpec>& sort) {
    json::array arr;
    for (const auto& s : sort) {
        json::object o;
        o["columnId"] = s.column_id;
        o["direction"] = s.direction == SortDirection::Desc ? "desc" : "asc";
        arr.push_back(std::move(o));
    }
    return arr;
}

json::value columns_to_json(const std::vector<ColumnVisibility>& columns) {
    json::array arr;
    for (const auto& c : columns) {
        json::object o;
        o["columnId"] = c.column_id;
        o["visible"] = c.visible;
        o["order"] = c.order;
        arr.push_back(std::move(o));
    }
    return arr;
}

std::vector<FilterGroup> filters_from_json(const json::value& v) {
    std::vector<FilterGroup> out;
    if (v.is_null()) return out;
    for (const auto& item : expect_array(v, "filters")) {
        const json::object& g = expect_object(item, "filter group");
        FilterGroup group;
        group.id = string_field(g, "id", "filter group");

        auto logic = g.find("logic");
        if (logic != g.end()) {
            if (!logic->value().is_string()) throw ValidationError("filter group logic must be a string");
            const json::string& l = logic->value().get_string();
            if (l == "OR" || l == "or") group.logic = FilterLogic::Or;
            else if (l == "AND" || l == "and") group.logic = FilterLogic::And;
            else throw ValidationError("filter group logic must be AND or OR");
        }

        auto conds = g.find("conditions");
        if (conds != g.end()) {
            for (const auto& c : expect_array(conds->value(), "conditions")) {
                const json::object& co = expect_object(c, "filter condition");
                FilterCondition cond;
                cond.column_id = string_field(co, "columnId", "filter condition");
                cond.op = string_field(co, "operator", "filter condition");
                cond.value = scalar_field(co, "value");
                group.conditions.push_back(std::move(cond));
            }
        }
        out.push_back(std::move(group));
    }
    return out;
}

std::vector<SortSpec> sort_from_json(const json::value& v) {
    std::vector<SortSpec> out;
    if (v.is_null()) return out;
    for (const auto& item : expect_array(v, "sort")) {
        const json::object& o = expect_object(item, "sort entry");
        SortSpec spec;
        spec.column_id = string_field(o, "columnId", "sort entry");
        auto dir = o.find("direction");
        if (dir != o.end()) {
            if (!dir->value().is_string()) throw ValidationError("sort direction must be a string");
            const json::string& d = dir->value().get_string();
            if (d == "desc") spec.direction = SortDirection::Desc;
            else if (d == "asc") spec.direction = SortDirection::Asc;
            else throw ValidationError("sort direction must be asc or desc");
        }
        out.push_back(std::move(spec));
    }
    return out;
}

std::vector<ColumnVisibility> columns_from_json(const json::value& v) {
    std::vector<ColumnVisibility> out;
    if (v.is_null()) return out;
    int position = 0;
    for (const auto& item : expect_array(v, "columns")) {
        const json::object& o = expect_object(item, "column entry");
        ColumnVisibility c;
        c.column_id = string_field(o, "columnId", "column entry");
        c.order = position;

        auto vis = o.find("visible");
        if (vis != o.end()) {
            if (!vis->value().is_bool()) throw ValidationError("column visible must be a boolean");
            c.visible = vis->value().get_bool();
        }
        auto ord = o.find("order");
        if (ord != o.end()) {
            if (!ord->value().is_int64()) throw ValidationError("column order must be an integer");
            c.order = static_cast<int>(ord->value().get_int64());
        }
        out.push_back(std::move(c));
        ++position;
    }
    return out;
}

json::object config_to_json(const ViewConfig& config) {
    json::object o;
    o["filters"] = filters_to_json(config.filters);
    o["sort"] = sort_to_json(config.sort);
    o["columns"] = columns_to_json(config.columns);
    o["search"] = config.search;
    return o;
}

ViewConfig config_from_json(const json::value& v) {
    const json::object& o = expect_object(v, "view config");
    ViewConfig config;
    if (auto it = o.find("filters"); it != o.end()) config.filters = filters_from_json(it->value());
    if (auto it = o.find("sort"); it != o.end()) config.sort = sort_from_json(it->value());
    if (auto it = o.find("columns"); it != o.end()) config.columns = columns_from_json(it->value());
    if (auto it = o.find("search"); it != o.end() && it->value().is_string()) {
        const json::string& s = it->value().get_string();
        config.search.assign(s.data(), s.size());
    }
    return config;
}

json::object view_to_json(const View& view) {
    json::object o;
    o["id"] = view.id;
    o["tableId"] = view.table_id;
    o["name"] = view.name;
    o["version"] = view.version;
    o["config"] = config_to_json(view.config);
    return o;
}

json::object patch_to_json(const Patch& patch) {
    json::object o;
    o["op"] = patch_op_str(patch.op);
    o["path"] = patch_path_str(patch.path);
    o["value"] = patch.value;
    o["timestamp"] = patch.timestamp;
    return o;
}

Patch patch_from_json(const json::value& v) {
    const json::object& o = expect_object(v, "patch");
    Patch patch;
    patch.op = parse_patch_op(string_field(o, "op", "patch"));
    patch.path = parse_patch_path(string_field(o, "path", "patch"));
    if (auto it = o.find("value"); it != o.end()) patch.value = it->value();
    if (auto it = o.find("timestamp"); it != o.end() && it->value().is_int64()) {
        patch.timestamp = it->value().get_int64();
    }
    return patch;
}

} // namespace gridsync::view
