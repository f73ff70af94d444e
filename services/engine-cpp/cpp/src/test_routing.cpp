/**
 * @file test_routing.cpp
 * @brief Test suite validating routes against a ground-truth CSV.
 *
 * Truth rows: source,dest,mode,expected_cost,expected_path
 * (expected_cost -1 and an empty path for unreachable pairs).
 *
 * Usage:
 *   ./build/test_routing --airports data/seed_airports.csv \
 *       --flights data/seed_flights.csv --truth data/seed_truth.csv
 */

#include "engine_errors.hpp"
#include "flight_store.hpp"
#include "query_params.hpp"
#include "shortest_path.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

using namespace flight_routing;

struct TestCase {
    std::string source;
    std::string dest;
    std::string mode;
    double expected;
    std::string expected_path;
};

struct TestResult {
    int total = 0;
    int passed = 0;
    int mismatches = 0;
    int close_matches = 0;  // Within tolerance but not exact
    int strategy_disagreements = 0;
    double total_ms = 0;
};

std::vector<TestCase> load_test_cases(const std::string& path) {
    std::vector<TestCase> cases;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open " << path << "\n";
        return cases;
    }

    std::string line;
    std::getline(file, line);  // Skip header

    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto row = split_csv_line(line);
        if (row.size() >= 4) {
            TestCase tc;
            tc.source = row[0];
            tc.dest = row[1];
            tc.mode = row[2];
            tc.expected = std::stod(row[3]);
            tc.expected_path = row.size() >= 5 ? row[4] : "";
            cases.push_back(tc);
        }
    }
    return cases;
}

std::string join_path(const std::vector<std::string>& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += "-";
        out += path[i];
    }
    return out;
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --airports PATH    Airports CSV or Parquet\n"
              << "  --flights PATH     Flights CSV or Parquet\n"
              << "  --truth PATH       Ground truth CSV\n"
              << "  --verbose          Print each query result\n"
              << "  --help             Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string airports_path, flights_path, truth_path;
    bool verbose = false;
    double tolerance = 0.001;  // 0.1% for distances

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--airports" && i + 1 < argc) {
            airports_path = argv[++i];
        } else if (arg == "--flights" && i + 1 < argc) {
            flights_path = argv[++i];
        } else if (arg == "--truth" && i + 1 < argc) {
            truth_path = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    if (airports_path.empty() || flights_path.empty() || truth_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    FlightStore store;
    std::cout << "Loading airports: " << airports_path << "\n";
    if (!store.load_airports(airports_path)) {
        std::cerr << "Failed to load airports\n";
        return 1;
    }
    std::cout << "Loading flights: " << flights_path << "\n";
    if (!store.load_flights(flights_path)) {
        std::cerr << "Failed to load flights\n";
        return 1;
    }
    FlightGraph graph = store.build_graph();
    std::cout << "Loaded " << graph.vertex_count() << " airports, " << graph.edge_count() << " flights\n\n";

    std::cout << "Loading test cases: " << truth_path << "\n";
    auto test_cases = load_test_cases(truth_path);
    if (test_cases.empty()) {
        std::cerr << "No test cases loaded\n";
        return 1;
    }
    std::cout << "Loaded " << test_cases.size() << " test cases\n\n";

    TestResult result;
    result.total = test_cases.size();

    ShortestPathEngine heap(DijkstraStrategy::HEAP);
    ShortestPathEngine array(DijkstraStrategy::ARRAY);

    std::cout << "Running tests (heap and array strategies)\n";
    std::cout << std::string(50, '-') << "\n";

    for (const auto& tc : test_cases) {
        WeightMode mode = parse_weight_mode(tc.mode.c_str());

        ShortestPathResult r, a;
        try {
            auto t0 = std::chrono::steady_clock::now();
            r = heap.solve(graph, tc.source, tc.dest, mode);
            auto t1 = std::chrono::steady_clock::now();
            result.total_ms += std::chrono::duration<double, std::milli>(t1 - t0).count();
            a = array.solve(graph, tc.source, tc.dest, mode);
        } catch (const std::exception& e) {
            result.mismatches++;
            std::cerr << "ERROR: " << tc.source << " -> " << tc.dest << " (" << tc.mode << "): " << e.what() << "\n";
            continue;
        }

        if (a.found != r.found || a.came_from != r.came_from || a.distances != r.distances) {
            result.strategy_disagreements++;
            std::cerr << "STRATEGY MISMATCH: " << tc.source << " -> " << tc.dest << " (" << tc.mode << ")\n";
        }

        double actual = r.found ? r.cost : -1;
        std::string actual_path = r.found ? join_path(r.route.path) : "";

        bool exact_match = false;
        bool close_match = false;

        if (tc.expected < 0 && actual < 0) {
            exact_match = true;  // Both unreachable
        } else if (tc.expected >= 0 && actual >= 0 && actual_path == tc.expected_path) {
            double diff = std::abs(actual - tc.expected);
            double rel_diff = diff / std::max(tc.expected, 0.001);
            exact_match = (diff < 0.01);
            close_match = (rel_diff < tolerance);
        }

        if (verbose) {
            std::cout << tc.source << " -> " << tc.dest << " [" << tc.mode << "]: "
                      << actual << " " << actual_path << "\n";
        }

        if (exact_match) {
            result.passed++;
        } else if (close_match) {
            result.close_matches++;
        } else {
            result.mismatches++;
            std::cerr << "MISMATCH: " << tc.source << " -> " << tc.dest << " [" << tc.mode << "]"
                      << " expected=" << tc.expected << " " << tc.expected_path
                      << " got=" << actual << " " << actual_path << "\n";
        }
    }

    std::cout << std::string(50, '=') << "\n";
    std::cout << "RESULTS:\n";
    std::cout << "  Total:          " << result.total << "\n";
    std::cout << "  Exact match:    " << result.passed
              << " (" << std::fixed << std::setprecision(1)
              << (100.0 * result.passed / result.total) << "%)\n";
    std::cout << "  Close match:    " << result.close_matches
              << " (" << (100.0 * result.close_matches / result.total) << "%)\n";
    std::cout << "  Mismatches:     " << result.mismatches
              << " (" << (100.0 * result.mismatches / result.total) << "%)\n";
    std::cout << "  Strategy diffs: " << result.strategy_disagreements << "\n";
    std::cout << "\n";
    std::cout << "PERFORMANCE:\n";
    std::cout << "  Total time:     " << result.total_ms << " ms\n";
    std::cout << "  Avg per query:  " << (result.total_ms / result.total) << " ms\n";

    int failed = result.mismatches + result.strategy_disagreements;
    if (failed == 0) {
        std::cout << "\n✓ ALL TESTS PASSED\n";
    } else {
        std::cout << "\n✗ " << failed << " TESTS FAILED\n";
    }

    return failed == 0 ? 0 : 1;
}
