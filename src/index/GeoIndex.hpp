#pragma once

#include "../core/Types.hpp"
#include <functional>
#include <memory>
#include <string>

namespace corridor::index {

// 订阅事件回调
struct QueryCallbacks {
    // 每条落在查询圆内的记录触发一次
    std::function<void(const std::string& key, const geo::LatLng& location)> onKeyEntered;
    // 初始命中集合全部送达后触发一次
    std::function<void()> onReady;
};

// 一次圆形查询的订阅句柄
class IGeoQuery {
public:
    virtual ~IGeoQuery() = default;

    // 释放索引端资源，ready 之后必须调用。可重复调用
    virtual void cancel() = 0;

    virtual bool cancelled() const noexcept = 0;
};

// 外部地理索引接口：只支持圆形半径查询
class IGeoIndex {
public:
    virtual ~IGeoIndex() = default;

    // radiusKm 单位为公里。事件可能在返回句柄之前就已送达
    virtual std::shared_ptr<IGeoQuery>
    query(const geo::LatLng& center, double radiusKm, QueryCallbacks callbacks) = 0;
};

} // namespace corridor::index
