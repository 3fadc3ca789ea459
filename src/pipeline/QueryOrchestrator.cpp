#include "QueryOrchestrator.hpp"
#include "../geo/GeoMath.hpp"
#include "../index/RadiusQuery.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace corridor::pipeline {

double corridorDistance(const std::optional<geo::LatLng>& prev,
                        const geo::LatLng& current,
                        const std::optional<geo::LatLng>& next,
                        const geo::LatLng& location) noexcept {
    // Leg 端点只看到采样点的直线距离
    if (!prev || !next) {
        return geo::distanceMeters(current, location);
    }

    return std::min(geo::closestDistanceToSegment(*prev, current, location),
                    geo::closestDistanceToSegment(current, *next, location));
}

bool withinBuffer(double minDistance, double bufferWidth) noexcept {
    return minDistance - bufferWidth <= geo::BUFFER_RADIUS_MIN;
}

size_t mergeMatches(core::MatchMap& into, const std::vector<core::IndexMatch>& matches) {
    size_t inserted = 0;
    for (const auto& match : matches) {
        if (into.try_emplace(match.key, match).second) {
            ++inserted;
        }
    }
    return inserted;
}

PendingLeg::PendingLeg(core::QuerySection section,
                       std::vector<std::future<std::vector<core::IndexMatch>>> queries,
                       double bufferWidth)
    : section_(std::move(section)), queries_(std::move(queries)), bufferWidth_(bufferWidth) {
}

core::LegResult PendingLeg::collect() {
    core::LegResult result;
    const auto& points = section_.samplePoints;

    for (size_t i = 0; i < queries_.size(); ++i) {
        const auto prev = i == 0 ? std::nullopt : std::optional<geo::LatLng>(points[i - 1]);
        const auto next = i + 1 == points.size() ? std::nullopt : std::optional<geo::LatLng>(points[i + 1]);

        // 查询半径比缓冲宽度大，必须逐条做邻近判断
        std::vector<core::IndexMatch> accepted;
        for (auto& match : queries_[i].get()) {
            const double minDistance = corridorDistance(prev, points[i], next, match.location);
            if (withinBuffer(minDistance, bufferWidth_)) {
                accepted.push_back(std::move(match));
            }
        }

        mergeMatches(result.matches, accepted);
    }

    queries_.clear();
    result.querySection = std::move(section_);
    return result;
}

PendingLeg QueryOrchestrator::dispatch(core::QuerySection section) const {
    // 索引的半径单位为公里
    const double radiusKm = queryRadius_ / 1000.0;

    std::vector<std::future<std::vector<core::IndexMatch>>> queries;
    queries.reserve(section.samplePoints.size());
    for (const auto& point : section.samplePoints) {
        queries.push_back(index::queryRadius(*index_, point, radiusKm));
    }

    if (enableLogging_) {
        spdlog::debug("派发 {} 个圆形查询，半径 {:.3f} km，区段长度 {:.1f} m",
                      queries.size(), radiusKm, section.distance);
    }

    return PendingLeg{std::move(section), std::move(queries), bufferWidth_};
}

core::LegResult QueryOrchestrator::run(core::QuerySection section) const {
    return dispatch(std::move(section)).collect();
}

} // namespace corridor::pipeline
