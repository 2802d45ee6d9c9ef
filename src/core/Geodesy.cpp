/**
 * @file Geodesy.cpp
 * @brief Haversine distance implementation
 */

#include "Geodesy.hpp"
#include <cmath>

namespace wayslope {

double haversine_distance_km(const Coordinate& start, const Coordinate& end) {
    double lat1 = degrees_to_radians(start.lat);
    double lat2 = degrees_to_radians(end.lat);
    double d_lat = degrees_to_radians(end.lat - start.lat);
    double d_lon = degrees_to_radians(end.lon - start.lon);

    double sin_lat = std::sin(d_lat / 2.0);
    double sin_lon = std::sin(d_lon / 2.0);
    double a = sin_lat * sin_lat + std::cos(lat1) * std::cos(lat2) * sin_lon * sin_lon;
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return EARTH_RADIUS_KM * c;
}

double haversine_distance_m(const Coordinate& start, const Coordinate& end) {
    return haversine_distance_km(start, end) * 1000.0;
}

} // namespace wayslope
