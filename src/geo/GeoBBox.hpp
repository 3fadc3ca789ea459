#pragma once

namespace corridor::geo {

// WGS84 经纬度点（度）
struct LatLng {
    double latitude{0.0};
    double longitude{0.0};

    constexpr LatLng() = default;
    constexpr LatLng(double lat, double lng)
        : latitude(lat), longitude(lng) {}

    constexpr bool operator==(const LatLng& other) const noexcept = default;
};

// WGS84 地理坐标包围盒
struct GeoBBox {
    double minLat{0.0};
    double minLng{0.0};
    double maxLat{0.0};
    double maxLng{0.0};

    constexpr GeoBBox() = default;
    constexpr GeoBBox(double minLat, double minLng, double maxLat, double maxLng)
        : minLat(minLat), minLng(minLng), maxLat(maxLat), maxLng(maxLng) {}

    // 边界点视为包含
    constexpr bool contains(const LatLng& point) const noexcept {
        return point.latitude >= minLat && point.latitude <= maxLat &&
               point.longitude >= minLng && point.longitude <= maxLng;
    }
};

// 纯函数：球冠（center 周围 radiusMeters 以内）的外接包围盒
// 覆盖极点或跨越日期变更线时经度范围取满
[[nodiscard]] GeoBBox boundsAround(const LatLng& center, double radiusMeters) noexcept;

} // namespace corridor::geo
