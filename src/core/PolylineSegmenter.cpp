#define _USE_MATH_DEFINES
#include "PolylineSegmenter.hpp"
#include "../geo/GeoMath.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace corridor::core {

namespace {
    constexpr double SIXTY_DEGREES = M_PI / 3.0;
}

double bufferStepLength(double bufferWidth) noexcept {
    return bufferWidth / std::sin(SIXTY_DEGREES);
}

QuerySection buildQuerySection(const Leg& leg, double stepLength) {
    QuerySection section;
    if (leg.empty()) {
        return section;
    }

    section.start = leg.front();

    geo::LatLng segmentStart = leg.front();
    geo::LatLng segmentEnd = leg.front();

    for (size_t i = 1; i < leg.size(); ++i) {
        segmentEnd = leg[i];
        const double distance = geo::distanceMeters(segmentStart, segmentEnd);

        // 重复点，跳到下一个点
        if (distance == 0.0) {
            continue;
        }

        section.distance += distance;
        section.samplePoints.push_back(segmentStart);

        // 本线段上需要移动 stepLength 的次数
        const auto stepCount = static_cast<size_t>(std::trunc(distance / stepLength));
        geo::LatLng cursor = segmentStart;
        for (size_t k = 0; k < stepCount; ++k) {
            cursor = geo::moveTowards(cursor, segmentEnd, stepLength);
            section.samplePoints.push_back(cursor);
        }

        // segmentEnd 是下一段的起点，在下一轮写入
        segmentStart = segmentEnd;
    }

    // 最后一个端点
    section.samplePoints.push_back(segmentEnd);
    section.end = segmentEnd;

    return section;
}

std::vector<QuerySection> buildQuerySections(const std::vector<Leg>& legs, double stepLength) {
    std::vector<QuerySection> sections;
    sections.reserve(legs.size());

    std::transform(legs.begin(), legs.end(), std::back_inserter(sections),
                   [stepLength](const Leg& leg) { return buildQuerySection(leg, stepLength); });

    return sections;
}

} // namespace corridor::core
