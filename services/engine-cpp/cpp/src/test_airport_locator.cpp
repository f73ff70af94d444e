/**
 * @file test_airport_locator.cpp
 * @brief Nearest-airport queries over both spatial index types.
 */

#include "airport_locator.hpp"
#include "engine_errors.hpp"
#include "geo_utils.hpp"
#include "test_support.hpp"

using namespace flight_routing;
using test_support::TestResult;

static std::vector<std::string> codes(const std::vector<NearbyAirport>& found) {
    std::vector<std::string> out;
    for (const auto& n : found) out.push_back(n.airport.code);
    return out;
}

static void test_distance(TestResult& t) {
    t.check_near(geo_utils::great_circle_km(31.5216, 74.4036, 40.6413, -73.7781), 11349.68, 1.0,
                 "LHE-JFK great-circle distance");
    t.check_near(geo_utils::great_circle_km(10, 20, 10, 20), 0.0, 1e-9, "zero distance");
    t.check_near(geo_utils::great_circle_km(0, 0, 0, 180), M_PI * geo_utils::EARTH_RADIUS_KM, 1.0,
                 "half circumference");
}

static void test_index(TestResult& t, SpatialIndexType type) {
    const std::string name = spatial_index_name(type);
    AirportLocator locator(type);
    locator.build(test_support::seed_airports());
    t.check(locator.size() == 7, name + ": all airports indexed");

    auto near_doha = locator.find_nearest(25.26, 51.56, 3, 1000);
    t.check(codes(near_doha) == std::vector<std::string>({"DOH", "DXB"}), name + ": airports near Doha");
    t.check(!near_doha.empty() && near_doha[0].distance_km < 5.0, name + ": nearest distance");

    auto wide = locator.find_nearest(25.26, 51.56, 10, 20000);
    t.check(wide.size() == 7, name + ": whole world within 20000 km");
    bool ordered = true;
    for (size_t i = 1; i < wide.size(); ++i) {
        if (wide[i - 1].distance_km > wide[i].distance_km) ordered = false;
    }
    t.check(ordered, name + ": nearest first");

    auto top2 = locator.find_nearest(25.26, 51.56, 2, 20000);
    t.check(codes(top2) == std::vector<std::string>({"DOH", "DXB"}), name + ": truncated to k");

    auto empty = locator.find_nearest(-45.0, -120.0, 5, 100);
    t.check(empty.empty(), name + ": nothing in the South Pacific");

    t.check_throws<ValidationError>([&] { locator.find_nearest(91, 0, 1, 10); }, name + ": latitude range");
    t.check_throws<ValidationError>([&] { locator.find_nearest(0, 181, 1, 10); }, name + ": longitude range");
    t.check_throws<ValidationError>([&] { locator.find_nearest(0, 0, 0, 10); }, name + ": k at least 1");
    t.check_throws<ValidationError>([&] { locator.find_nearest(0, 0, 1, 0); }, name + ": positive radius");
}

static void test_antimeridian(TestResult& t, SpatialIndexType type) {
    AirportLocator locator(type);
    locator.build({test_support::airport("EST", 0.0, 179.9), test_support::airport("WST", 0.0, -179.9)});

    auto found = locator.find_nearest(0.0, 179.95, 5, 50);
    t.check(codes(found) == std::vector<std::string>({"EST", "WST"}),
            std::string(spatial_index_name(type)) + ": search crosses the antimeridian");
}

static void test_polar_box(TestResult& t, SpatialIndexType type) {
    const std::string name = spatial_index_name(type);
    AirportLocator locator(type);
    locator.build({test_support::airport("POL", 85.0, -120.0), test_support::airport("HIL", 62.5, 27.5)});

    // Across the pole: 1668 km away on the opposite meridian
    auto polar = locator.find_nearest(80.0, 60.0, 5, 2000);
    t.check(codes(polar) == std::vector<std::string>({"POL"}), name + ": search reaches across the pole");

    // Near the box edge closest to the pole, where the longitude band is widest
    auto high = locator.find_nearest(60.0, 0.0, 5, 1500);
    t.check(codes(high) == std::vector<std::string>({"HIL"}), name + ": high-latitude airport near the radius");
}

static std::string grid_code(int i) {
    std::string code = "G";
    code += static_cast<char>('A' + i / 26 / 26 % 26);
    code += static_cast<char>('A' + i / 26 % 26);
    code += static_cast<char>('A' + i % 26);
    return code;
}

static void test_index_agreement(TestResult& t) {
    // Ring of airports just inside and just outside 2000 km of (0, 0)
    std::vector<Airport> airports = {
        test_support::airport("EAS", 0.0, 17.5),
        test_support::airport("NOR", 17.4, 0.0),
        test_support::airport("EDG", 0.0, 17.9),
        test_support::airport("OUT", -12.0, 13.5),
    };
    int n = 0;
    for (double lat = 30.0; lat <= 75.0; lat += 3.0) {
        for (double lon = -30.0; lon <= 50.0; lon += 4.0) {
            airports.push_back(test_support::airport(grid_code(n++), lat, lon));
        }
    }

    AirportLocator h3(SpatialIndexType::H3);
    AirportLocator rtree(SpatialIndexType::RTREE);
    h3.build(airports);
    rtree.build(airports);

    auto ring = h3.find_nearest(0.0, 0.0, 10, 2000);
    t.check(codes(ring) == std::vector<std::string>({"NOR", "EAS", "EDG"}), "h3: every airport within 2000 km");

    struct Query { double lat, lon, radius; };
    for (const Query& q : {Query{0.0, 0.0, 2000}, Query{52.0, 10.0, 2000}, Query{66.0, -5.0, 1800},
                           Query{40.0, 30.0, 1200}}) {
        size_t expected = 0;
        for (const auto& a : airports) {
            if (geo_utils::great_circle_km(q.lat, q.lon, a.latitude, a.longitude) <= q.radius) expected++;
        }
        auto from_h3 = h3.find_nearest(q.lat, q.lon, airports.size(), q.radius);
        auto from_rtree = rtree.find_nearest(q.lat, q.lon, airports.size(), q.radius);
        std::string label = "(" + std::to_string(q.lat) + ", " + std::to_string(q.lon) + ")";
        t.check(from_h3.size() == expected, "h3 finds all within radius of " + label);
        t.check(from_rtree.size() == expected, "rtree finds all within radius of " + label);
        t.check(codes(from_h3) == codes(from_rtree), "h3 and rtree agree at " + label);
    }
}

int main() {
    TestResult t;

    test_distance(t);
    for (SpatialIndexType type : {SpatialIndexType::RTREE, SpatialIndexType::H3}) {
        test_index(t, type);
        test_antimeridian(t, type);
        test_polar_box(t, type);
    }
    test_index_agreement(t);

    t.check(parse_spatial_index_type("H3") == SpatialIndexType::H3, "index type parsing");
    t.check_throws<ValidationError>([] { parse_spatial_index_type("kd"); }, "unknown index type");

    return t.report("airport_locator");
}
