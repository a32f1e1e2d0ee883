#include "gridsync/error.hpp"

#include <cstring>

namespace gridsync {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:            return "success";
        case ErrorCode::INVALID_ARGUMENT:   return "invalid_argument";
        case ErrorCode::NOT_FOUND:          return "not_found";
        case ErrorCode::VALIDATION_FAILED:  return "validation";
        case ErrorCode::VERSION_CONFLICT:   return "version_conflict";
        case ErrorCode::CONNECTION_FAILED:  return "connection_failed";
        case ErrorCode::QUERY_FAILED:       return "query_failed";
        case ErrorCode::TRANSACTION_FAILED: return "transaction_failed";
        case ErrorCode::TRANSIENT_STORE:    return "transient_store";
        case ErrorCode::COPY_FAILED:        return "copy_failed";
        case ErrorCode::INTERNAL_ERROR:     return "internal";
    }
    return "unknown";
}

bool is_transient_sqlstate(const char* sqlstate) {
    if (!sqlstate || std::strlen(sqlstate) != 5) return false;
    if (std::strncmp(sqlstate, "08", 2) == 0) return true;
    return std::strcmp(sqlstate, "57P01") == 0 ||
           std::strcmp(sqlstate, "40001") == 0 ||
           std::strcmp(sqlstate, "40P01") == 0;
}

} // namespace gridsync
