/**
 * @file helpers.hpp
 * @brief PostgreSQL helper functions for consistent data access
 *
 * Consolidates common patterns for:
 * - Result value extraction (with null/type handling)
 * - Parameterized query execution
 * - Error classification into the gridsync taxonomy
 *
 * Every statement that carries user data goes through exec_params; SQL text
 * is never assembled from values.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

#include "gridsync/error.hpp"

namespace gridsync::db {

// =============================================================================
// Result Value Extraction Helpers
// =============================================================================

/**
 * Safe extraction of string value from PGresult.
 * Returns empty string if null or out of bounds.
 */
inline std::string get_string(PGresult* res, int row, int col) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return {};
    }
    if (PQgetisnull(res, row, col)) {
        return {};
    }
    const char* val = PQgetvalue(res, row, col);
    return val ? val : "";
}

/**
 * Safe extraction of int64 value from PGresult.
 * Returns default_val if null, empty, or parse error.
 */
inline int64_t get_int64(PGresult* res, int row, int col, int64_t default_val = 0) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return default_val;
    }
    if (PQgetisnull(res, row, col)) {
        return default_val;
    }
    const char* val = PQgetvalue(res, row, col);
    if (!val || *val == '\0') {
        return default_val;
    }
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        return default_val;
    }
}

// =============================================================================
// Query Execution Helpers
// =============================================================================

/**
 * RAII wrapper for PGresult.
 */
class Result {
public:
    Result() : res_(nullptr) {}
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }
    operator PGresult*() const { return res_; }

    bool ok() const {
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    bool has_rows() const {
        return res_ && PQresultStatus(res_) == PGRES_TUPLES_OK && PQntuples(res_) > 0;
    }

    int ntuples() const { return res_ ? PQntuples(res_) : 0; }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

    // SQLSTATE of a failed statement, or null
    const char* sqlstate() const {
        return res_ ? PQresultErrorField(res_, PG_DIAG_SQLSTATE) : nullptr;
    }

    std::string str(int row, int col) const { return get_string(res_, row, col); }
    int64_t int64(int row, int col, int64_t def = 0) const { return get_int64(res_, row, col, def); }

private:
    PGresult* res_;
};

inline Result exec(PGconn* conn, const char* sql) {
    return Result(PQexec(conn, sql));
}

inline Result exec(PGconn* conn, const std::string& sql) {
    return exec(conn, sql.c_str());
}

// Text-format parameters; std::nullopt binds SQL NULL.
using Params = std::vector<std::optional<std::string>>;

inline Result exec_params(PGconn* conn, const char* sql, const Params& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }
    return Result(PQexecParams(conn, sql, static_cast<int>(values.size()), nullptr,
                               values.data(), nullptr, nullptr, 0));
}

/**
 * Rows affected by an INSERT/UPDATE/DELETE; 0 when unknown.
 */
inline int cmd_tuples(PGresult* res) {
    if (!res) return 0;
    const char* val = PQcmdTuples(res);
    if (!val || *val == '\0') return 0;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        return 0;
    }
}

/**
 * Throws the classified error for a failed result; no-op when ok.
 * Connection loss and serialization failures become TransientStoreError.
 */
inline void check(const Result& res, PGconn* conn, const std::string& context) {
    if (res.ok()) return;
    std::string msg = res.get() ? res.error_message() : std::string(PQerrorMessage(conn));
    if (PQstatus(conn) != CONNECTION_OK || is_transient_sqlstate(res.sqlstate())) {
        throw TransientStoreError(msg, context);
    }
    throw DatabaseError(msg, context);
}

inline Result exec_checked(PGconn* conn, const char* sql, const Params& params, const std::string& context) {
    Result res = exec_params(conn, sql, params);
    check(res, conn, context);
    return res;
}

} // namespace gridsync::db
