#pragma once

#include <string>

#include "gridsync/error.hpp"

namespace gridsync::store {

// Supplies the acting user for every store call.
class SessionResolver {
public:
    virtual ~SessionResolver() = default;

    // Throws NotFoundError when no user is signed in.
    virtual std::string current_user() const = 0;
};

// Single fixed user (CLI, tests).
class FixedSession : public SessionResolver {
public:
    explicit FixedSession(std::string user_id) : user_id_(std::move(user_id)) {}

    std::string current_user() const override {
        if (user_id_.empty()) {
            throw NotFoundError("no acting user", "FixedSession");
        }
        return user_id_;
    }

private:
    std::string user_id_;
};

} // namespace gridsync::store
