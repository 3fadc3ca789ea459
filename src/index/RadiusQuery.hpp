#pragma once

#include "GeoIndex.hpp"
#include <future>
#include <vector>

namespace corridor::index {

// 将事件订阅式查询包装为 future：
// 收集 ready 之前送达的全部记录，ready 后取消订阅再兑现结果。
// 索引抛出的异常与空句柄都通过 future 传递
[[nodiscard]] std::future<std::vector<core::IndexMatch>>
queryRadius(IGeoIndex& index, const geo::LatLng& center, double radiusKm);

} // namespace corridor::index
