#pragma once

#include <boost/asio/thread_pool.hpp>

#include "gridsync/api/table_api.hpp"
#include "gridsync/sync/scheduler.hpp"
#include "gridsync/sync/view_service.hpp"

namespace gridsync::sync {

/**
 * ViewService answered in-process by a TableApi.
 *
 * Store calls block, so they run on a private worker pool; completions are
 * posted back to the coordinator's Scheduler.
 */
class LocalViewService : public ViewService {
public:
    LocalViewService(api::TableApi& api, Scheduler& scheduler, size_t workers = 1)
        : api_(api), scheduler_(scheduler), pool_(workers) {}

    ~LocalViewService() override { pool_.join(); }

    void apply_patches(const std::string& view_id, int64_t version,
                       std::vector<view::Patch> patches, ViewCallback done) override;
    void list_views(const std::string& table_id, ListCallback done) override;
    void create_view(const std::string& table_id, const std::string& name,
                     view::ViewConfig config, ViewCallback done) override;
    void delete_view(const std::string& view_id, DoneCallback done) override;

private:
    template <typename T, typename Call>
    void run(Call call, std::function<void(Outcome<T>)> done);

    api::TableApi& api_;
    Scheduler& scheduler_;
    boost::asio::thread_pool pool_;
};

} // namespace gridsync::sync
