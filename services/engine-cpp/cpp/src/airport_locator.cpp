/**
 * @file airport_locator.cpp
 * @brief Spatial index build and nearest-airport queries.
 */

#include "airport_locator.hpp"
#include "engine_errors.hpp"
#include "geo_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <iterator>
#include <unordered_set>

namespace flight_routing {

// Approximate spacing between neighbouring H3 cell centers at resolution 3
constexpr double H3_RES3_SPACING_KM = 104.0;
// Ring k of a hex grid is only guaranteed to reach k * sqrt(3)/2 spacings
constexpr double H3_RING_REACH = 0.866;
// Cell sizes vary over the globe; widen the ring count to cover the smallest
constexpr double H3_DISTORTION_MARGIN = 1.5;
// Beyond this ring count a full scan is cheaper than walking rings
constexpr int MAX_H3_RINGS = 40;

static double to_radians(double deg) { return deg * M_PI / 180.0; }
static double to_degrees(double rad) { return rad * 180.0 / M_PI; }

SpatialIndexType parse_spatial_index_type(const std::string& name) {
    std::string s = name;
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "h3") return SpatialIndexType::H3;
    if (s == "rtree") return SpatialIndexType::RTREE;
    throw ValidationError("Spatial index must be 'h3' or 'rtree'");
}

const char* spatial_index_name(SpatialIndexType type) {
    return type == SpatialIndexType::H3 ? "h3" : "rtree";
}

AirportLocator::AirportLocator(SpatialIndexType type, int h3_res) : type_(type), h3_res_(h3_res) {}

void AirportLocator::build(const std::vector<Airport>& airports) {
    airports_ = airports;
    h3_index_.clear();
    rtree_.reset();

    if (type_ == SpatialIndexType::RTREE) {
        std::vector<LocatorValue> items;
        items.reserve(airports_.size());
        for (uint32_t i = 0; i < airports_.size(); ++i) {
            items.push_back({LocatorPoint(airports_[i].longitude, airports_[i].latitude), i});
        }
        rtree_ = std::make_unique<bgi::rtree<LocatorValue, bgi::quadratic<16>>>(items.begin(), items.end());
        std::cout << "Airport R-tree built with " << items.size() << " airports" << std::endl;
    } else {
        for (uint32_t i = 0; i < airports_.size(); ++i) {
            uint64_t cell = geo_utils::latlng_to_cell(airports_[i].latitude, airports_[i].longitude, h3_res_);
            if (cell != 0) h3_index_[cell].push_back(i);
        }
        std::cout << "Airport H3 index built with " << h3_index_.size() << " cells (res "
                  << h3_res_ << ")" << std::endl;
    }
}

std::vector<uint32_t> AirportLocator::candidates_rtree(double lat, double lon, double radius_km) const {
    std::vector<uint32_t> out;
    if (!rtree_) return out;

    double r = radius_km / geo_utils::EARTH_RADIUS_KM;
    double min_lat = lat - to_degrees(r);
    double max_lat = lat + to_degrees(r);

    // A cap reaching a pole spans every longitude
    double min_lon = -180.0, max_lon = 180.0;
    if (max_lat < 90.0 && min_lat > -90.0) {
        // Longitude half-width taken at the box edge nearest the pole
        double lat_edge = std::max(std::fabs(min_lat), std::fabs(max_lat));
        double s = std::sin(r) / std::cos(to_radians(lat_edge));
        if (s < 1.0) {
            double lon_radius = to_degrees(std::asin(s));
            min_lon = lon - lon_radius;
            max_lon = lon + lon_radius;
        }
    }
    // Box crossing the antimeridian: search every longitude
    if (min_lon < -180.0 || max_lon > 180.0) {
        min_lon = -180.0;
        max_lon = 180.0;
    }
    LocatorBox query_box(LocatorPoint(min_lon, std::max(-90.0, min_lat)),
                         LocatorPoint(max_lon, std::min(90.0, max_lat)));

    std::vector<LocatorValue> hits;
    rtree_->query(bgi::intersects(query_box), std::back_inserter(hits));
    for (const auto& [point, idx] : hits) out.push_back(idx);
    return out;
}

std::vector<uint32_t> AirportLocator::candidates_h3(double lat, double lon, double radius_km) const {
    std::vector<uint32_t> out;

    uint64_t origin = geo_utils::latlng_to_cell(lat, lon, h3_res_);
    double spacing = H3_RES3_SPACING_KM * std::pow(std::sqrt(7.0), 3 - h3_res_);
    int k_max = static_cast<int>(std::ceil(radius_km * H3_DISTORTION_MARGIN / (H3_RING_REACH * spacing))) + 1;

    if (origin == 0 || k_max > MAX_H3_RINGS) {
        out.resize(airports_.size());
        for (uint32_t i = 0; i < out.size(); ++i) out[i] = i;
        return out;
    }

    for (uint64_t cell : geo_utils::grid_disk(origin, k_max)) {
        auto it = h3_index_.find(cell);
        if (it == h3_index_.end()) continue;
        out.insert(out.end(), it->second.begin(), it->second.end());
    }
    return out;
}

std::vector<NearbyAirport> AirportLocator::find_nearest(double lat, double lon, size_t k, double radius_km) const {
    if (!std::isfinite(lat) || lat < -90.0 || lat > 90.0) {
        throw ValidationError("lat must be between -90 and 90");
    }
    if (!std::isfinite(lon) || lon < -180.0 || lon > 180.0) {
        throw ValidationError("lon must be between -180 and 180");
    }
    if (k < 1) throw ValidationError("k must be at least 1");
    if (!(radius_km > 0)) throw ValidationError("radius_km must be positive");

    auto candidates = type_ == SpatialIndexType::RTREE ? candidates_rtree(lat, lon, radius_km)
                                                       : candidates_h3(lat, lon, radius_km);

    std::unordered_set<uint32_t> seen;
    std::vector<NearbyAirport> results;
    for (uint32_t idx : candidates) {
        if (!seen.insert(idx).second) continue;
        const Airport& a = airports_[idx];
        double dist = geo_utils::great_circle_km(lat, lon, a.latitude, a.longitude);
        if (dist <= radius_km) results.push_back({a, dist});
    }

    std::sort(results.begin(), results.end(), [](const NearbyAirport& a, const NearbyAirport& b) {
        if (a.distance_km != b.distance_km) return a.distance_km < b.distance_km;
        return a.airport.code < b.airport.code;
    });
    if (results.size() > k) results.resize(k);
    return results;
}

}  // namespace flight_routing
