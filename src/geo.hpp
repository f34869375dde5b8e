#pragma once

#include <cmath>
#include <numbers>

namespace parkwatch {

// Mean Earth radius used by every distance computation.
inline constexpr double earth_radius_m = 6371000.0;

struct coordinate {
    double latitude = 0.0;
    double longitude = 0.0;

    bool operator==(const coordinate&) const = default;
};

// Axis-aligned lat/lng rectangle. Does not cross the antimeridian.
struct bounding_box {
    double south = 0.0;
    double west = 0.0;
    double north = 0.0;
    double east = 0.0;

    bool valid() const {
        return std::isfinite(south) && std::isfinite(west) &&
               std::isfinite(north) && std::isfinite(east) &&
               south < north && west < east &&
               south >= -90.0 && north <= 90.0 &&
               west >= -180.0 && east <= 180.0;
    }

    bool contains(const coordinate& c) const {
        return c.latitude >= south && c.latitude <= north &&
               c.longitude >= west && c.longitude <= east;
    }

    coordinate center() const {
        return {(south + north) / 2.0, (west + east) / 2.0};
    }

    bool operator==(const bounding_box&) const = default;
};

inline double to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

inline double to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

bool is_valid_coordinate(const coordinate& c);

// Great-circle distance in meters (haversine).
double haversine_m(const coordinate& a, const coordinate& b);

// Meters spanned by one degree of latitude on the sphere.
inline double meters_per_degree_lat() {
    return earth_radius_m * std::numbers::pi / 180.0;
}

// Meters spanned by one degree of longitude along the parallel at `latitude`.
inline double meters_per_degree_lng(double latitude) {
    return meters_per_degree_lat() * std::cos(to_radians(latitude));
}

// Smallest lat/lng box containing every point within radius_m of center.
// Computed on the sphere, so it never excludes a point the haversine check
// would accept. Returns false when the circle reaches a pole and no finite
// longitude span exists.
bool radius_bounds(const coordinate& center, double radius_m, bounding_box& out);

} // namespace parkwatch
