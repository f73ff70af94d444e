/**
 * @file geo_utils.cpp
 * @brief Great-circle distance (Boost.Geometry) and H3 helpers implementation.
 */

#include "geo_utils.hpp"
#include <h3/h3api.h>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <cmath>

namespace bg = boost::geometry;

namespace geo_utils {

// Spherical point in degrees, (lon, lat) order as Boost.Geometry expects
using GeoPoint = bg::model::point<double, 2, bg::cs::spherical_equatorial<bg::degree>>;

double great_circle_km(double lat1, double lon1, double lat2, double lon2) {
    static const bg::strategy::distance::haversine<double> haversine(EARTH_RADIUS_KM);
    return bg::distance(GeoPoint(lon1, lat1), GeoPoint(lon2, lat2), haversine);
}

uint64_t latlng_to_cell(double lat, double lng, int res) {
    if (res < 0 || res > 15) return 0;

    LatLng ll;
    ll.lat = degsToRads(lat);
    ll.lng = degsToRads(lng);

    H3Index cell = 0;
    if (latLngToCell(&ll, res, &cell) != E_SUCCESS) {
        return 0;
    }
    return cell;
}

std::vector<uint64_t> grid_disk(uint64_t center, int k) {
    std::vector<uint64_t> result;
    if (center == 0 || k < 0) return result;

    int64_t disk_size = 0;
    if (maxGridDiskSize(k, &disk_size) != E_SUCCESS) {
        return result;
    }

    std::vector<H3Index> disk(disk_size, 0);
    if (gridDisk(center, k, disk.data()) != E_SUCCESS) {
        return result;
    }

    // gridDisk leaves zeros in unused slots near pentagons
    for (auto c : disk) {
        if (c != 0) result.push_back(c);
    }
    return result;
}

}  // namespace geo_utils
