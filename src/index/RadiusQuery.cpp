#include "RadiusQuery.hpp"
#include <mutex>
#include <stdexcept>

namespace corridor::index {

namespace {

// 一次查询的共享状态，由订阅回调和发起方共同持有
struct PendingQuery {
    std::mutex mutex;
    std::vector<core::IndexMatch> matches;
    std::shared_ptr<IGeoQuery> handle;
    bool ready{false};
    bool settled{false};
    std::promise<std::vector<core::IndexMatch>> promise;

    // 调用方需持有 mutex。ready 与句柄都到位后才取消并兑现
    void settleLocked() {
        if (settled || !ready || !handle) {
            return;
        }
        settled = true;

        // 先放开句柄，打断 状态 -> 句柄 -> 回调 -> 状态 的引用环
        auto subscription = std::move(handle);
        subscription->cancel();
        promise.set_value(std::move(matches));
    }

    void failLocked(std::exception_ptr error) {
        if (settled) {
            return;
        }
        settled = true;
        handle.reset();
        promise.set_exception(std::move(error));
    }
};

} // namespace

std::future<std::vector<core::IndexMatch>>
queryRadius(IGeoIndex& index, const geo::LatLng& center, double radiusKm) {
    auto state = std::make_shared<PendingQuery>();
    auto result = state->promise.get_future();

    QueryCallbacks callbacks;
    callbacks.onKeyEntered = [state](const std::string& key, const geo::LatLng& location) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->ready && !state->settled) {
            state->matches.push_back(core::IndexMatch{key, location});
        }
    };
    callbacks.onReady = [state]() {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->ready = true;
        state->settleLocked();
    };

    std::shared_ptr<IGeoQuery> subscription;
    try {
        subscription = index.query(center, radiusKm, std::move(callbacks));
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->failLocked(std::current_exception());
        return result;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    if (!subscription) {
        state->failLocked(std::make_exception_ptr(
            std::runtime_error("geo index returned no query handle")));
        return result;
    }

    // ready 可能已在 query() 返回前送达，此时由这里完成取消和兑现
    state->handle = std::move(subscription);
    state->settleLocked();

    return result;
}

} // namespace corridor::index
