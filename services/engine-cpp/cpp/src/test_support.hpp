/**
 * @file test_support.hpp
 * @brief Shared fixtures and result tally for the engine test executables.
 *
 * The seed network is the one in data/seed_*.csv, built in code so the unit
 * tests run without data files.
 */

#pragma once

#include "flight_graph.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_support {

using flight_routing::Airport;
using flight_routing::FlightEdge;
using flight_routing::FlightGraph;

struct TestResult {
    int total = 0;
    int passed = 0;
    int failures = 0;

    void check(bool ok, const std::string& name) {
        total++;
        if (ok) {
            passed++;
        } else {
            failures++;
            std::cerr << "FAILED: " << name << "\n";
        }
    }

    void check_near(double actual, double expected, double eps, const std::string& name) {
        bool ok = std::abs(actual - expected) <= eps;
        check(ok, name);
        if (!ok) std::cerr << "  expected=" << expected << " got=" << actual << "\n";
    }

    /// Runs fn and records a pass only if it throws E.
    template <typename E, typename Fn>
    void check_throws(Fn&& fn, const std::string& name) {
        bool thrown = false;
        try {
            fn();
        } catch (const E&) {
            thrown = true;
        } catch (const std::exception& e) {
            std::cerr << "  unexpected exception: " << e.what() << "\n";
        }
        check(thrown, name);
    }

    int report(const std::string& suite) const {
        std::cout << std::string(50, '=') << "\n";
        std::cout << "RESULTS (" << suite << "):\n";
        std::cout << "  Total:          " << total << "\n";
        std::cout << "  Passed:         " << passed << "\n";
        std::cout << "  Failures:       " << failures << "\n";
        if (failures == 0) {
            std::cout << "\n✓ ALL TESTS PASSED\n";
        } else {
            std::cout << "\n✗ " << failures << " TESTS FAILED\n";
        }
        return failures == 0 ? 0 : 1;
    }
};

inline Airport airport(const std::string& code, double lat, double lon) {
    Airport a;
    a.code = code;
    a.name = code;
    a.latitude = lat;
    a.longitude = lon;
    return a;
}

inline FlightEdge flight(const std::string& flight_no, const std::string& from, const std::string& to,
                         int duration_min, double price) {
    FlightEdge f;
    f.airline = flight_no.substr(0, 2);
    f.flight_no = flight_no;
    f.source = from;
    f.dest = to;
    f.duration_min = duration_min;
    f.price = price;
    return f;
}

inline std::vector<Airport> seed_airports() {
    return {
        airport("LHE", 31.5216, 74.4036),
        airport("DXB", 25.2532, 55.3657),
        airport("DOH", 25.2611, 51.5651),
        airport("IST", 41.2753, 28.7519),
        airport("FRA", 50.0379, 8.5622),
        airport("JFK", 40.6413, -73.7781),
        airport("MID", 36.0, -10.0),
    };
}

/// Seven-flight network: cheapest LHE->JFK is LHE-DXB-DOH-JFK, fastest is LHE-DOH-JFK.
inline FlightGraph seed_graph() {
    std::vector<FlightEdge> flights = {
        flight("PK201", "LHE", "DXB", 150, 200),
        flight("EK301", "DXB", "DOH", 45, 150),
        flight("QR501", "DOH", "JFK", 480, 250),
        flight("QR201", "LHE", "DOH", 120, 450),
        flight("TK101", "LHE", "IST", 270, 400),
        flight("TK601", "IST", "JFK", 360, 700),
        flight("PK999", "LHE", "JFK", 720, 1500),
    };
    return FlightGraph::build(seed_airports(), flights);
}

inline std::string join(const std::vector<std::string>& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += "-";
        out += path[i];
    }
    return out;
}

}  // namespace test_support
