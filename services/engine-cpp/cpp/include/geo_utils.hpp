/**
 * @file geo_utils.hpp
 * @brief Great-circle distance and H3 helpers for airport coordinates.
 */

#pragma once

#include <cstdint>
#include <utility>
#include <vector>

namespace geo_utils {

/// Mean Earth radius used for all route distances.
constexpr double EARTH_RADIUS_KM = 6371.0;

/**
 * @brief Haversine distance in kilometers between two (lat, lon) points in degrees.
 */
double great_circle_km(double lat1, double lon1, double lat2, double lon2);

/**
 * @brief Convert lat/lng to H3 cell at given resolution.
 */
uint64_t latlng_to_cell(double lat, double lng, int res);

/**
 * @brief All cells within grid distance k of center (center included).
 * Empty on H3 errors.
 */
std::vector<uint64_t> grid_disk(uint64_t center, int k);

}  // namespace geo_utils
