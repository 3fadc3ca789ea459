#define _USE_MATH_DEFINES
#include "geo/GeoBBox.hpp"
#include "geo/GeoMath.hpp"
#include <algorithm>
#include <cmath>

namespace corridor::geo {

namespace {
    constexpr double toRadians(double degrees) {
        return degrees * M_PI / 180.0;
    }

    constexpr double toDegrees(double radians) {
        return radians * 180.0 / M_PI;
    }
}

GeoBBox boundsAround(const LatLng& center, double radiusMeters) noexcept {
    // 角半径
    const double delta = std::max(radiusMeters, 0.0) / EARTH_RADIUS;
    const double lat = toRadians(center.latitude);

    const double minLat = toDegrees(lat - delta);
    const double maxLat = toDegrees(lat + delta);

    // 球冠包含极点
    if (minLat <= -90.0 || maxLat >= 90.0) {
        return GeoBBox{std::max(minLat, -90.0), -180.0, std::min(maxLat, 90.0), 180.0};
    }

    // 球冠上的最大经度差：asin(sin(delta) / cos(lat))
    const double ratio = std::sin(delta) / std::cos(lat);
    if (ratio >= 1.0) {
        return GeoBBox{minLat, -180.0, maxLat, 180.0};
    }

    const double deltaLng = toDegrees(std::asin(ratio));
    const double minLng = center.longitude - deltaLng;
    const double maxLng = center.longitude + deltaLng;
    if (minLng < -180.0 || maxLng > 180.0) {
        return GeoBBox{minLat, -180.0, maxLat, 180.0};
    }

    return GeoBBox{minLat, minLng, maxLat, maxLng};
}

} // namespace corridor::geo
