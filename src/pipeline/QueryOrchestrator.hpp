#pragma once

#include "../core/Types.hpp"
#include "../index/GeoIndex.hpp"
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace corridor::pipeline {

// 采样点到走廊的距离：
// 有前后邻点时取到两侧线段的最近距离；
// Leg 端点（缺任一邻点）取到采样点自身的距离
[[nodiscard]] double corridorDistance(const std::optional<geo::LatLng>& prev,
                                      const geo::LatLng& current,
                                      const std::optional<geo::LatLng>& next,
                                      const geo::LatLng& location) noexcept;

// 命中判定：minDistance - bufferWidth <= BUFFER_RADIUS_MIN
[[nodiscard]] bool withinBuffer(double minDistance, double bufferWidth) noexcept;

// 合并一个采样点的命中，按 key 去重，先到者保留。返回新增条数
size_t mergeMatches(core::MatchMap& into, const std::vector<core::IndexMatch>& matches);

// 已派发、尚未汇总的一条 Leg
class PendingLeg {
public:
    PendingLeg(core::QuerySection section,
               std::vector<std::future<std::vector<core::IndexMatch>>> queries,
               double bufferWidth);

    PendingLeg(PendingLeg&&) noexcept = default;
    PendingLeg& operator=(PendingLeg&&) noexcept = default;

    // 按采样点顺序等待各子查询，过滤并合并。子查询的异常原样抛出
    [[nodiscard]] core::LegResult collect();

    const core::QuerySection& section() const noexcept { return section_; }
    size_t queryCount() const noexcept { return queries_.size(); }

private:
    core::QuerySection section_;
    std::vector<std::future<std::vector<core::IndexMatch>>> queries_;
    double bufferWidth_;
};

// 对一个查询区段的每个采样点发起圆形查询并汇总
class QueryOrchestrator {
public:
    // queryRadius 与 bufferWidth 单位为米
    QueryOrchestrator(std::shared_ptr<index::IGeoIndex> index,
                      double queryRadius,
                      double bufferWidth,
                      bool enableLogging = true)
        : index_(std::move(index)), queryRadius_(queryRadius), bufferWidth_(bufferWidth),
          enableLogging_(enableLogging) {}

    // 为每个采样点发起一次查询，不等待结果
    [[nodiscard]] PendingLeg dispatch(core::QuerySection section) const;

    // dispatch + collect
    [[nodiscard]] core::LegResult run(core::QuerySection section) const;

    double queryRadius() const noexcept { return queryRadius_; }
    double bufferWidth() const noexcept { return bufferWidth_; }

private:
    std::shared_ptr<index::IGeoIndex> index_;
    double queryRadius_;
    double bufferWidth_;
    bool enableLogging_;
};

} // namespace corridor::pipeline
