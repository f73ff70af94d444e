/**
 * @file airport_locator.hpp
 * @brief Nearest-airport lookup over an H3 cell index or a Boost.Geometry R-tree.
 */

#pragma once

#include "flight_graph.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/index/rtree.hpp>

namespace flight_routing {

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

// (lon, lat) in degrees; distances are refined with great_circle_km
using LocatorPoint = bg::model::point<double, 2, bg::cs::cartesian>;
using LocatorBox = bg::model::box<LocatorPoint>;
using LocatorValue = std::pair<LocatorPoint, uint32_t>;

enum class SpatialIndexType {
    H3,
    RTREE
};

/// "h3" or "rtree" (case-insensitive); throws ValidationError otherwise.
SpatialIndexType parse_spatial_index_type(const std::string& name);
const char* spatial_index_name(SpatialIndexType type);

struct NearbyAirport {
    Airport airport;
    double distance_km = 0.0;
};

class AirportLocator {
public:
    explicit AirportLocator(SpatialIndexType type = SpatialIndexType::RTREE, int h3_res = 3);

    void build(const std::vector<Airport>& airports);

    /**
     * @brief Up to k airports within radius_km, nearest first (ties by code).
     *
     * Throws ValidationError for coordinates out of range, k < 1 or a
     * non-positive radius.
     */
    std::vector<NearbyAirport> find_nearest(double lat, double lon, size_t k, double radius_km) const;

    SpatialIndexType type() const { return type_; }
    size_t size() const { return airports_.size(); }

private:
    std::vector<uint32_t> candidates_rtree(double lat, double lon, double radius_km) const;
    std::vector<uint32_t> candidates_h3(double lat, double lon, double radius_km) const;

    SpatialIndexType type_;
    int h3_res_;
    std::vector<Airport> airports_;
    std::unique_ptr<bgi::rtree<LocatorValue, bgi::quadratic<16>>> rtree_;
    std::unordered_map<uint64_t, std::vector<uint32_t>> h3_index_;
};

}  // namespace flight_routing
