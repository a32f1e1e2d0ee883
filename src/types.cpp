#include "gridsync/types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace gridsync {

const char* column_type_str(ColumnType t) {
    switch (t) {
        case ColumnType::Text:   return "TEXT";
        case ColumnType::Number: return "NUMBER";
    }
    return "TEXT";
}

std::optional<ColumnType> parse_column_type(const std::string& s) {
    if (s == "TEXT") return ColumnType::Text;
    if (s == "NUMBER") return ColumnType::Number;
    return std::nullopt;
}

std::string format_number(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 9.0e15) {
        return std::to_string(static_cast<int64_t>(value));
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    return buf;
}

std::string to_display_string(const ScalarValue& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    if (const auto* d = std::get_if<double>(&v)) return format_number(*d);
    return {};
}

bool value_matches_type(const ScalarValue& v, ColumnType type) {
    if (is_null(v)) return true;
    return type == ColumnType::Text ? is_text(v) : is_number(v);
}

Cell Cell::make(std::string id, std::string row_id, const Column& column, const ScalarValue& value) {
    Cell cell;
    cell.id = std::move(id);
    cell.row_id = std::move(row_id);
    cell.column_id = column.id;
    if (column.type == ColumnType::Text) {
        if (const auto* s = std::get_if<std::string>(&value)) cell.v_text = *s;
    } else {
        if (const auto* d = std::get_if<double>(&value)) cell.v_number = *d;
    }
    return cell;
}

std::string build_search_text(const std::vector<Column>& columns, const RowCache& cache) {
    std::string out;
    for (const auto& column : columns) {
        auto it = cache.find(column.id);
        if (it == cache.end() || is_null(it->second)) continue;
        std::string text = to_display_string(it->second);
        if (text.empty()) continue;
        if (!out.empty()) out += ' ';
        out += text;
    }
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace gridsync
