#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gridsync {

// =============================================================================
// Columns
// =============================================================================

enum class ColumnType : char {
    Text = 'T',
    Number = 'N'
};

// "TEXT" / "NUMBER", as stored in the "Column".type column.
const char* column_type_str(ColumnType t);
std::optional<ColumnType> parse_column_type(const std::string& s);

struct Column {
    std::string id;
    std::string table_id;
    std::string name;
    ColumnType type = ColumnType::Text;
};

// =============================================================================
// Scalar values
// =============================================================================

/**
 * A cell or cache value: null, text, or number.
 * Numbers are doubles; whole numbers format without a fraction.
 */
using ScalarValue = std::variant<std::monostate, std::string, double>;

inline bool is_null(const ScalarValue& v) { return std::holds_alternative<std::monostate>(v); }
inline bool is_text(const ScalarValue& v) { return std::holds_alternative<std::string>(v); }
inline bool is_number(const ScalarValue& v) { return std::holds_alternative<double>(v); }

// Number as it would appear in JSON or a search string ("42", "2.5").
std::string format_number(double value);

// Stringified value, empty for null.
std::string to_display_string(const ScalarValue& v);

// True if the value's populated slot matches the column's declared type (null always matches).
bool value_matches_type(const ScalarValue& v, ColumnType type);

// =============================================================================
// Rows and cells
// =============================================================================

// Denormalized column-id -> value map kept on every row.
using RowCache = std::map<std::string, ScalarValue>;

struct Row {
    std::string id;
    std::string table_id;
    RowCache cache;
    std::string search;
    int64_t created_at_us = 0;  // microseconds since epoch

    // Absent keys read as null (columns added after the row was written).
    ScalarValue value(const std::string& column_id) const {
        auto it = cache.find(column_id);
        return it == cache.end() ? ScalarValue{} : it->second;
    }
};

// Keyset position of a row: (createdAt, id) in total order.
struct RowKey {
    int64_t created_at_us = 0;
    std::string id;

    bool operator<(const RowKey& o) const {
        return created_at_us != o.created_at_us ? created_at_us < o.created_at_us : id < o.id;
    }
    bool operator==(const RowKey& o) const {
        return created_at_us == o.created_at_us && id == o.id;
    }
};

inline RowKey key_of(const Row& row) { return RowKey{row.created_at_us, row.id}; }

struct Cell {
    std::string id;
    std::string row_id;
    std::string column_id;
    std::optional<std::string> v_text;
    std::optional<double> v_number;

    // Builds a cell with the slot chosen by the column type; the other slot stays null.
    static Cell make(std::string id, std::string row_id, const Column& column, const ScalarValue& value);
};

// Lower-cased, space-joined stringified non-null values of the cache, in column order.
std::string build_search_text(const std::vector<Column>& columns, const RowCache& cache);

} // namespace gridsync
