#include "MemoryGeoIndex.hpp"
#include "../geo/GeoMath.hpp"
#include <atomic>
#include <spdlog/spdlog.h>

namespace corridor::index {

// 记录与订阅计数，查询任务和索引共同持有
struct MemoryGeoIndex::Store {
    mutable std::mutex mutex;
    std::unordered_map<std::string, geo::LatLng> entries;
    size_t activeQueries{0};

    std::vector<core::IndexMatch> within(const geo::LatLng& center, double radiusMeters) const {
        const auto bounds = geo::boundsAround(center, radiusMeters);

        std::vector<core::IndexMatch> matches;
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [key, location] : entries) {
            // 先用包围盒粗筛
            if (!bounds.contains(location)) {
                continue;
            }
            if (geo::distanceMeters(center, location) <= radiusMeters) {
                matches.push_back(core::IndexMatch{key, location});
            }
        }
        return matches;
    }
};

namespace {

class MemoryGeoQuery : public IGeoQuery {
public:
    MemoryGeoQuery(std::shared_ptr<MemoryGeoIndex::Store> store, QueryCallbacks callbacks)
        : store_(std::move(store)), callbacks_(std::move(callbacks)) {}

    void cancel() override {
        if (cancelled_.exchange(true)) {
            return;
        }
        std::lock_guard<std::mutex> lock(store_->mutex);
        --store_->activeQueries;
    }

    bool cancelled() const noexcept override {
        return cancelled_.load();
    }

    // 仅在事件循环线程调用
    void deliver(const std::vector<core::IndexMatch>& matches) {
        for (const auto& match : matches) {
            if (cancelled()) {
                return;
            }
            if (callbacks_.onKeyEntered) {
                callbacks_.onKeyEntered(match.key, match.location);
            }
        }
        if (!cancelled() && callbacks_.onReady) {
            callbacks_.onReady();
        }
    }

private:
    std::shared_ptr<MemoryGeoIndex::Store> store_;
    QueryCallbacks callbacks_;
    std::atomic<bool> cancelled_{false};
};

} // namespace

MemoryGeoIndex::MemoryGeoIndex()
    : store_(std::make_shared<Store>()) {
}

MemoryGeoIndex::~MemoryGeoIndex() {
    const auto pending = activeQueryCount();
    if (pending > 0) {
        spdlog::warn("MemoryGeoIndex 析构时仍有 {} 个订阅未取消", pending);
    }
}

void MemoryGeoIndex::set(const std::string& key, const geo::LatLng& location) {
    std::lock_guard<std::mutex> lock(store_->mutex);
    store_->entries.insert_or_assign(key, location);
}

void MemoryGeoIndex::set(const std::vector<core::IndexMatch>& entries) {
    std::lock_guard<std::mutex> lock(store_->mutex);
    for (const auto& entry : entries) {
        store_->entries.insert_or_assign(entry.key, entry.location);
    }
}

bool MemoryGeoIndex::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(store_->mutex);
    return store_->entries.erase(key) > 0;
}

std::optional<geo::LatLng> MemoryGeoIndex::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(store_->mutex);
    auto it = store_->entries.find(key);
    if (it == store_->entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t MemoryGeoIndex::size() const {
    std::lock_guard<std::mutex> lock(store_->mutex);
    return store_->entries.size();
}

size_t MemoryGeoIndex::activeQueryCount() const {
    std::lock_guard<std::mutex> lock(store_->mutex);
    return store_->activeQueries;
}

std::vector<core::IndexMatch> MemoryGeoIndex::within(const geo::LatLng& center, double radiusMeters) const {
    return store_->within(center, radiusMeters);
}

std::shared_ptr<IGeoQuery>
MemoryGeoIndex::query(const geo::LatLng& center, double radiusKm, QueryCallbacks callbacks) {
    auto subscription = std::make_shared<MemoryGeoQuery>(store_, std::move(callbacks));
    {
        std::lock_guard<std::mutex> lock(store_->mutex);
        ++store_->activeQueries;
    }

    const double radiusMeters = radiusKm * 1000.0;
    // 任务只持有 Store 和订阅，不持有索引本身
    try {
        loop_.post([store = store_, subscription, center, radiusMeters]() {
            if (subscription->cancelled()) {
                return;
            }
            subscription->deliver(store->within(center, radiusMeters));
        });
    } catch (const std::exception&) {
        subscription->cancel();
        throw;
    }

    return subscription;
}

} // namespace corridor::index
