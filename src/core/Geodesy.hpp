#pragma once

/**
 * @file Geodesy.hpp
 * @brief Great-circle distance on a spherical Earth
 */

#include "way_slope.hpp"

namespace wayslope {

/// Mean Earth radius used for haversine distances
constexpr double EARTH_RADIUS_KM = 6371.0;

constexpr double degrees_to_radians(double degrees) {
    return degrees * 3.14159265358979323846 / 180.0;
}

/**
 * @brief Haversine great-circle distance
 * @return Distance in kilometers
 */
double haversine_distance_km(const Coordinate& start, const Coordinate& end);

/**
 * @brief Haversine great-circle distance
 * @return Distance in meters
 */
double haversine_distance_m(const Coordinate& start, const Coordinate& end);

} // namespace wayslope
