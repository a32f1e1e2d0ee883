#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace gridsync {

/**
 * Error taxonomy shared by the store, ingestion and view sync layers.
 *
 * NotFound and Validation are fatal to the calling operation and never
 * retried. VersionConflict is recovered locally by refetch + retry.
 * TransientStore is retried only where the caller has a retry policy
 * (paginated reads); bulk batches are isolated instead.
 */
enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Domain errors
    NOT_FOUND = 10,
    VALIDATION_FAILED = 11,
    VERSION_CONFLICT = 12,

    // Store errors
    CONNECTION_FAILED = 100,
    QUERY_FAILED = 101,
    TRANSACTION_FAILED = 102,
    TRANSIENT_STORE = 103,
    COPY_FAILED = 104,

    INTERNAL_ERROR = 500
};

const char* error_code_name(ErrorCode code);

class GridsyncException : public std::runtime_error {
public:
    explicit GridsyncException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    // The bare message, without code/context decoration.
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "gridsync error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public GridsyncException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : GridsyncException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Table, view or column missing, or not owned by the acting user.
class NotFoundError : public GridsyncException {
public:
    explicit NotFoundError(const std::string& message,
                           const std::string& context = "")
        : GridsyncException(ErrorCode::NOT_FOUND, message, context) {}
};

// Out-of-bounds counts or names, default view deletion. Surfaced verbatim.
class ValidationError : public GridsyncException {
public:
    explicit ValidationError(const std::string& message,
                             const std::string& context = "")
        : GridsyncException(ErrorCode::VALIDATION_FAILED, message, context) {}
};

class VersionConflictError : public GridsyncException {
public:
    VersionConflictError(const std::string& view_id, int64_t expected,
                         std::optional<int64_t> current = std::nullopt)
        : GridsyncException(ErrorCode::VERSION_CONFLICT,
                            "Version conflict on view " + view_id +
                            ": expected " + std::to_string(expected) +
                            (current ? ", server has " + std::to_string(*current) : std::string()),
                            "", "Refetch the view and retry")
        , view_id_(view_id)
        , expected_(expected)
        , current_(current) {}

    const std::string& view_id() const noexcept { return view_id_; }
    int64_t expected_version() const noexcept { return expected_; }
    std::optional<int64_t> current_version() const noexcept { return current_; }

private:
    std::string view_id_;
    int64_t expected_;
    std::optional<int64_t> current_;
};

class DatabaseError : public GridsyncException {
public:
    explicit DatabaseError(const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : GridsyncException(ErrorCode::QUERY_FAILED, message, context, suggestion) {}

    DatabaseError(ErrorCode code, const std::string& message,
                  const std::string& context = "")
        : GridsyncException(code, message, context) {}
};

// Network drop, timeout, serialization failure. Safe to retry.
class TransientStoreError : public DatabaseError {
public:
    explicit TransientStoreError(const std::string& message,
                                 const std::string& context = "")
        : DatabaseError(ErrorCode::TRANSIENT_STORE, message, context) {}
};

/**
 * Maps a libpq SQLSTATE (may be null) to the taxonomy.
 * Class 08 (connection), 57P01 (admin shutdown), 40001 / 40P01
 * (serialization / deadlock) are transient; everything else is not.
 */
bool is_transient_sqlstate(const char* sqlstate);

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "") {
        if (!condition) {
            throw GridsyncException(code, message, context);
        }
    }
};

#define GRIDSYNC_CHECK(condition, code, message) \
    gridsync::ErrorHandler::check_condition(condition, code, message, __func__)

#define GRIDSYNC_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw gridsync::ValidationError(message, __func__); } while (0)

#define GRIDSYNC_THROW(code, message) \
    throw gridsync::GridsyncException(code, message, __func__)

} // namespace gridsync
