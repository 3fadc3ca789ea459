#pragma once

#include "../geo/GeoBBox.hpp"
#include <map>
#include <string>
#include <vector>

namespace corridor::core {

// 调用方提供的一条折线（有序经纬度点）
using Leg = std::vector<geo::LatLng>;

// 由一条 Leg 采样得到的查询区段
struct QuerySection {
    geo::LatLng start;
    geo::LatLng end;
    double distance{0.0};                  // 各线段长度之和（米）
    std::vector<geo::LatLng> samplePoints; // 圆形查询的中心点序列

    bool empty() const noexcept { return samplePoints.empty(); }
    size_t sampleCount() const noexcept { return samplePoints.size(); }
};

// 索引返回的一条记录
struct IndexMatch {
    std::string key;
    geo::LatLng location;

    bool operator==(const IndexMatch& other) const = default;
};

// 按 key 去重后的命中集合
using MatchMap = std::map<std::string, IndexMatch>;

// 单条 Leg 的分析结果
struct LegResult {
    QuerySection querySection;
    MatchMap matches;
};

// 与输入 Leg 顺序一一对应
using AnalysisResult = std::vector<LegResult>;

} // namespace corridor::core
