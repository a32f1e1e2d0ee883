#include "gridsync/store/view_store.hpp"

#include "gridsync/error.hpp"

namespace gridsync::store {

void validate_view_name(const std::string& name) {
    size_t first = name.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        throw ValidationError("View name must not be empty");
    }
    // Length in code points, not bytes.
    size_t length = 0;
    for (unsigned char ch : name) {
        if ((ch & 0xC0) != 0x80) ++length;
    }
    if (length > 100) {
        throw ValidationError("View name must be at most 100 characters");
    }
}

} // namespace gridsync::store
