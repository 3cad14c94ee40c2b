// core/geo.hpp
// Geographic coordinates and great-circle distance
#pragma once

#include <cmath>

namespace coverage {

struct Coordinate {
    double latitude;
    double longitude;

    Coordinate() : latitude(0.0), longitude(0.0) {}
    Coordinate(double lat, double lon) : latitude(lat), longitude(lon) {}

    bool operator==(const Coordinate& other) const {
        return latitude == other.latitude && longitude == other.longitude;
    }
};

// IUGG mean earth radius in meters
constexpr double EARTH_RADIUS_M = 6371008.8;

/**
 * Great-circle distance between two coordinates (haversine)
 *
 * @return Distance in meters
 */
inline double distance_m(const Coordinate& a, const Coordinate& b) {
    constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

    double lat1 = a.latitude * DEG_TO_RAD;
    double lat2 = b.latitude * DEG_TO_RAD;
    double dlat = (b.latitude - a.latitude) * DEG_TO_RAD;
    double dlon = (b.longitude - a.longitude) * DEG_TO_RAD;

    double s_lat = std::sin(dlat / 2.0);
    double s_lon = std::sin(dlon / 2.0);
    double h = s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon;
    if (h > 1.0) h = 1.0;  // rounding guard for antipodal points

    return 2.0 * EARTH_RADIUS_M * std::asin(std::sqrt(h));
}

} // namespace coverage
