#include "gridsync/sync/local_view_service.hpp"

#include <boost/asio/post.hpp>

namespace gridsync::sync {

template <typename T, typename Call>
void LocalViewService::run(Call call, std::function<void(Outcome<T>)> done) {
    boost::asio::post(pool_, [this, call = std::move(call), done = std::move(done)]() {
        Outcome<T> outcome;
        try {
            outcome = Outcome<T>::success(call());
        } catch (...) {
            // Handed to the caller, which classifies it.
            outcome = Outcome<T>::failure(std::current_exception());
        }
        scheduler_.post([done, outcome = std::move(outcome)]() { done(outcome); });
    });
}

void LocalViewService::apply_patches(const std::string& view_id, int64_t version,
                                     std::vector<view::Patch> patches, ViewCallback done) {
    run<view::View>([this, view_id, version, patches = std::move(patches)]() {
        return api_.apply_view_patches(view_id, version, patches);
    }, std::move(done));
}

void LocalViewService::list_views(const std::string& table_id, ListCallback done) {
    run<std::vector<view::View>>([this, table_id]() { return api_.list_views(table_id); }, std::move(done));
}

void LocalViewService::create_view(const std::string& table_id, const std::string& name,
                                   view::ViewConfig config, ViewCallback done) {
    run<view::View>([this, table_id, name, config = std::move(config)]() {
        return api_.create_view(table_id, name, config);
    }, std::move(done));
}

void LocalViewService::delete_view(const std::string& view_id, DoneCallback done) {
    run<bool>([this, view_id]() {
        api_.delete_view(view_id);
        return true;
    }, [done = std::move(done)](Outcome<bool> outcome) {
        if (done) done(outcome.error);
    });
}

} // namespace gridsync::sync
