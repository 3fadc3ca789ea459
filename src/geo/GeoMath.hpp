#pragma once

#include "GeoBBox.hpp"

namespace corridor::geo {

// 地球半径（米），球面模型
inline constexpr double EARTH_RADIUS = 6378137.0;

// 最小缓冲宽度（米）。同时作为几何退化判断和缓冲区命中判断的容差
inline constexpr double BUFFER_RADIUS_MIN = 0.1;

// 纯函数：计算两点间大圆距离（米）
[[nodiscard]] double distanceMeters(const LatLng& p1, const LatLng& p2) noexcept;

// 纯函数：沿大圆从 from 到 to 的 fraction 处的点
// 两点角距离极小时退化为经纬度线性插值
[[nodiscard]] LatLng interpolate(const LatLng& from, const LatLng& to, double fraction) noexcept;

// 纯函数：从 from 沿大圆朝 towards 移动 byMeters 米
// 要求 distanceMeters(from, towards) > 0，由调用方保证
[[nodiscard]] LatLng moveTowards(const LatLng& from, const LatLng& towards, double byMeters) noexcept;

/**
 * 纯函数：point 到线段 [segStart, segEnd] 的最近距离（米），不是到直线的距离。
 *
 * 以 a = |segStart segEnd|, b = |segStart point|, c = |segEnd point| 构成三角形，
 * 由余弦定理求 segStart 处的夹角 C，垂距为 sin(C) * b。
 * 以下情况按顺序优先处理：
 *   - 线段过短：取 min(b, c)
 *   - point 与某端点重合：取该端点距离
 *   - 垂足落在线段外：取较近一侧端点距离
 *   - 三点共线或夹角接近 0 / π：取 min(b, c)
 */
[[nodiscard]] double closestDistanceToSegment(const LatLng& segStart,
                                              const LatLng& segEnd,
                                              const LatLng& point) noexcept;

} // namespace corridor::geo
