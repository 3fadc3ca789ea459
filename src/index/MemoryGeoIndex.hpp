#pragma once

#include "GeoIndex.hpp"
#include "EventLoop.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace corridor::index {

/**
 * 内存地理索引，逐条扫描实现圆形查询。
 *
 * 查询结果在内部事件循环上异步送达：先逐条 onKeyEntered，再一次 onReady。
 * 订阅被取消后不再送达任何事件。
 */
class MemoryGeoIndex : public IGeoIndex {
public:
    MemoryGeoIndex();
    ~MemoryGeoIndex() override;

    MemoryGeoIndex(const MemoryGeoIndex&) = delete;
    MemoryGeoIndex& operator=(const MemoryGeoIndex&) = delete;

    // 写入或覆盖一条记录
    void set(const std::string& key, const geo::LatLng& location);

    // 批量写入
    void set(const std::vector<core::IndexMatch>& entries);

    // 删除记录，返回记录是否存在
    bool remove(const std::string& key);

    [[nodiscard]] std::optional<geo::LatLng> get(const std::string& key) const;

    [[nodiscard]] size_t size() const;

    // 已发起且尚未取消的订阅数
    [[nodiscard]] size_t activeQueryCount() const;

    std::shared_ptr<IGeoQuery>
    query(const geo::LatLng& center, double radiusKm, QueryCallbacks callbacks) override;

    // 同步扫描：返回 center 周围 radiusMeters 以内的全部记录
    [[nodiscard]] std::vector<core::IndexMatch> within(const geo::LatLng& center, double radiusMeters) const;

    struct Store;

private:
    std::shared_ptr<Store> store_;
    EventLoop loop_;  // 最后构造、最先析构，析构时送完剩余事件
};

} // namespace corridor::index
