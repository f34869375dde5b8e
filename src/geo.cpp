#include "geo.hpp"
#include <algorithm>

namespace parkwatch {

bool is_valid_coordinate(const coordinate& c) {
    return std::isfinite(c.latitude) && std::isfinite(c.longitude) &&
           c.latitude >= -90.0 && c.latitude <= 90.0 &&
           c.longitude >= -180.0 && c.longitude <= 180.0;
}

double haversine_m(const coordinate& a, const coordinate& b) {
    const double lat1 = to_radians(a.latitude);
    const double lat2 = to_radians(b.latitude);
    const double dlat = to_radians(b.latitude - a.latitude);
    const double dlng = to_radians(b.longitude - a.longitude);

    const double s1 = std::sin(dlat / 2.0);
    const double s2 = std::sin(dlng / 2.0);
    double h = s1 * s1 + std::cos(lat1) * std::cos(lat2) * s2 * s2;
    h = std::clamp(h, 0.0, 1.0);

    return 2.0 * earth_radius_m * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

bool radius_bounds(const coordinate& center, double radius_m, bounding_box& out) {
    // Small slack so floating point rounding in the box never drops a point
    // sitting exactly on the circle.
    constexpr double slack_deg = 1e-9;

    const double angular = radius_m / earth_radius_m;
    const double dlat = to_degrees(angular) + slack_deg;

    out.south = std::max(-90.0, center.latitude - dlat);
    out.north = std::min(90.0, center.latitude + dlat);

    const double cos_lat = std::cos(to_radians(center.latitude));
    const double sin_ang = std::sin(std::min(angular, std::numbers::pi / 2.0));
    if (angular >= std::numbers::pi / 2.0 || sin_ang >= cos_lat) {
        out.west = -180.0;
        out.east = 180.0;
        return false;
    }

    const double dlng = to_degrees(std::asin(sin_ang / cos_lat)) + slack_deg;
    out.west = std::max(-180.0, center.longitude - dlng);
    out.east = std::min(180.0, center.longitude + dlng);
    return true;
}

} // namespace parkwatch
