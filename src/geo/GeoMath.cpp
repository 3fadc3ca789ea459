#define _USE_MATH_DEFINES
#include "geo/GeoMath.hpp"
#include <algorithm>
#include <cmath>

namespace corridor::geo {

namespace {
    // 角度转弧度
    constexpr double toRadians(double degrees) {
        return degrees * M_PI / 180.0;
    }

    // 弧度转角度
    constexpr double toDegrees(double radians) {
        return radians * 180.0 / M_PI;
    }

    // 夹角过窄或过宽时三角形不可靠
    constexpr double MIN_STABLE_ANGLE = 0.0017;
    constexpr double MAX_STABLE_ANGLE = 3.14;

    // 球面线性插值退化阈值
    constexpr double MIN_INTERPOLATION_ANGLE = 1e-6;

    // 经度归一到 [-180, 180]
    double wrapLongitude(double degrees) noexcept {
        return std::remainder(degrees, 360.0);
    }

    // 两点间的中心角（弧度）
    double centralAngle(const LatLng& p1, const LatLng& p2) noexcept {
        const double lat1 = toRadians(p1.latitude);
        const double lat2 = toRadians(p2.latitude);
        const double deltaLat = toRadians(p2.latitude - p1.latitude);
        const double deltaLng = toRadians(p2.longitude - p1.longitude);

        const double a = std::sin(deltaLat / 2) * std::sin(deltaLat / 2) +
                         std::cos(lat1) * std::cos(lat2) *
                         std::sin(deltaLng / 2) * std::sin(deltaLng / 2);

        return 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    }
}

double distanceMeters(const LatLng& p1, const LatLng& p2) noexcept {
    // Haversine 公式
    return EARTH_RADIUS * centralAngle(p1, p2);
}

LatLng interpolate(const LatLng& from, const LatLng& to, double fraction) noexcept {
    const double angle = centralAngle(from, to);
    const double sinAngle = std::sin(angle);
    if (sinAngle < MIN_INTERPOLATION_ANGLE) {
        // 经度差取短弧一侧，跨日期变更线时不绕地球一周
        const double deltaLng = wrapLongitude(to.longitude - from.longitude);
        return LatLng{
            from.latitude + fraction * (to.latitude - from.latitude),
            wrapLongitude(from.longitude + fraction * deltaLng)
        };
    }

    const double fromLat = toRadians(from.latitude);
    const double fromLng = toRadians(from.longitude);
    const double toLat = toRadians(to.latitude);
    const double toLng = toRadians(to.longitude);

    const double a = std::sin((1 - fraction) * angle) / sinAngle;
    const double b = std::sin(fraction * angle) / sinAngle;

    // 在单位球的笛卡尔坐标下插值
    const double x = a * std::cos(fromLat) * std::cos(fromLng) + b * std::cos(toLat) * std::cos(toLng);
    const double y = a * std::cos(fromLat) * std::sin(fromLng) + b * std::cos(toLat) * std::sin(toLng);
    const double z = a * std::sin(fromLat) + b * std::sin(toLat);

    return LatLng{
        toDegrees(std::atan2(z, std::sqrt(x * x + y * y))),
        toDegrees(std::atan2(y, x))
    };
}

LatLng moveTowards(const LatLng& from, const LatLng& towards, double byMeters) noexcept {
    const double d = distanceMeters(from, towards);
    return interpolate(from, towards, byMeters / d);
}

double closestDistanceToSegment(const LatLng& segStart,
                                const LatLng& segEnd,
                                const LatLng& point) noexcept {
    const double a = distanceMeters(segStart, segEnd);
    const double b = distanceMeters(segStart, point);
    const double c = distanceMeters(segEnd, point);

    // 线段过短，直接取端点距离
    if (a < BUFFER_RADIUS_MIN) {
        return std::min(b, c);
    }
    // 点与端点几乎重合
    if (b < BUFFER_RADIUS_MIN) {
        return b;
    }
    if (c < BUFFER_RADIUS_MIN) {
        return c;
    }

    // segEnd 处的角 >= 90°，垂足在 segEnd 之外
    const double cosB = (a * a + c * c - b * b) / (2 * a * c);
    if (cosB <= 0) {
        return c;
    }

    // segStart 处的角 >= 90°，垂足在 segStart 之外
    const double cosC = (a * a + b * b - c * c) / (2 * a * b);
    if (cosC <= 0) {
        return b;
    }

    // 三点共线，无有效三角形
    if (cosC <= -1 || cosC >= 1) {
        return std::min(b, c);
    }

    const double angleC = std::acos(cosC);
    if (angleC < MIN_STABLE_ANGLE || angleC > MAX_STABLE_ANGLE) {
        return std::min(b, c);
    }

    return std::sin(angleC) * b;
}

} // namespace corridor::geo
