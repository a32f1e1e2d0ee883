#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "gridsync/view/view_model.hpp"

namespace gridsync::sync {

// Completion of an asynchronous call: a value or the exception it raised.
template <typename T>
struct Outcome {
    std::optional<T> value;
    std::exception_ptr error;

    bool ok() const { return !error; }

    static Outcome success(T v) {
        Outcome o;
        o.value = std::move(v);
        return o;
    }

    static Outcome failure(std::exception_ptr e) {
        Outcome o;
        o.error = std::move(e);
        return o;
    }
};

/**
 * Client-side transport for view records.
 *
 * Callbacks are always delivered on the coordinator's Scheduler, never
 * inline from the call. A rejected version arrives as VersionConflictError;
 * deleting the default view arrives as ValidationError.
 */
class ViewService {
public:
    using ViewCallback = std::function<void(Outcome<view::View>)>;
    using ListCallback = std::function<void(Outcome<std::vector<view::View>>)>;
    using DoneCallback = std::function<void(std::exception_ptr)>;

    virtual ~ViewService() = default;

    virtual void apply_patches(const std::string& view_id, int64_t version,
                               std::vector<view::Patch> patches, ViewCallback done) = 0;

    virtual void list_views(const std::string& table_id, ListCallback done) = 0;

    virtual void create_view(const std::string& table_id, const std::string& name,
                             view::ViewConfig config, ViewCallback done) = 0;

    virtual void delete_view(const std::string& view_id, DoneCallback done) = 0;
};

} // namespace gridsync::sync
