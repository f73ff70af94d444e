/**
 * @file benchmark_dijkstra.cpp
 * @brief Benchmark tool comparing array-based and heap-based Dijkstra
 * (wall time, operation counts, peak memory).
 */

#include "flight_store.hpp"
#include "route_planner.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <sys/resource.h>
#include <unistd.h>

using namespace flight_routing;

// Helper to get peak RSS memory usage in MB
double get_memory_usage_mb() {
    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        return usage.ru_maxrss / 1024.0; // Linux: ru_maxrss is in KB
    }
    return 0.0;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

// Random network: three-letter codes, coordinates spread over the globe
FlightGraph synthetic_graph(int airports, int flights_per_airport, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> lat(-60.0, 70.0);
    std::uniform_real_distribution<double> lon(-180.0, 180.0);
    std::uniform_real_distribution<double> price(50.0, 1500.0);
    std::uniform_int_distribution<int> duration(30, 900);
    std::uniform_int_distribution<int> pick(0, airports - 1);

    std::vector<Airport> nodes;
    for (int i = 0; i < airports; ++i) {
        Airport a;
        a.code = {static_cast<char>('A' + i / 676), static_cast<char>('A' + (i / 26) % 26),
                  static_cast<char>('A' + i % 26)};
        a.name = a.code + " Airport";
        a.latitude = lat(rng);
        a.longitude = lon(rng);
        nodes.push_back(std::move(a));
    }

    std::vector<FlightEdge> flights;
    for (int i = 0; i < airports; ++i) {
        for (int k = 0; k < flights_per_airport; ++k) {
            int j = pick(rng);
            if (j == i) continue;
            FlightEdge f;
            f.airline = "SYN";
            f.flight_no = "SY" + std::to_string(flights.size());
            f.source = nodes[i].code;
            f.dest = nodes[j].code;
            f.price = std::round(price(rng));
            f.duration_min = duration(rng);
            flights.push_back(std::move(f));
        }
    }
    return FlightGraph::build(std::move(nodes), flights);
}

int main(int argc, char* argv[]) {
    std::string airports_path, flights_path;
    int synthetic = 0;
    int degree = 8;
    int queries = 50;
    uint32_t seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--airports" && i + 1 < argc) {
            airports_path = argv[++i];
        } else if (arg == "--flights" && i + 1 < argc) {
            flights_path = argv[++i];
        } else if (arg == "--synthetic" && i + 1 < argc) {
            synthetic = std::stoi(argv[++i]);
        } else if (arg == "--degree" && i + 1 < argc) {
            degree = std::stoi(argv[++i]);
        } else if (arg == "--queries" && i + 1 < argc) {
            queries = std::stoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<uint32_t>(std::stoul(argv[++i]));
        }
    }

    bool from_files = !airports_path.empty() && !flights_path.empty();
    if (!from_files && (synthetic < 2 || synthetic > 26 * 26 * 26)) {
        std::cerr << "Usage: " << argv[0] << " --airports <path> --flights <path> [--queries N]\n"
                  << "       " << argv[0] << " --synthetic <airports 2-17576> [--degree D] [--queries N] [--seed S]\n";
        return 1;
    }

    std::cout << "Starting Dijkstra Benchmark\n";
    print_separator();

    double baseline_mem = get_memory_usage_mb();
    std::cout << "Baseline Memory: " << std::fixed << std::setprecision(2) << baseline_mem << " MB\n";
    print_separator();

    auto t0 = std::chrono::high_resolution_clock::now();
    FlightGraph graph;
    if (from_files) {
        FlightStore store;
        if (!store.load_airports(airports_path) || !store.load_flights(flights_path)) {
            std::cerr << "Failed to load flight data\n";
            return 1;
        }
        graph = store.build_graph();
    } else {
        graph = synthetic_graph(synthetic, degree, seed);
    }
    auto t1 = std::chrono::high_resolution_clock::now();

    std::cout << "Graph: " << graph.vertex_count() << " airports, " << graph.edge_count() << " flights\n";
    std::cout << "Build time: " << std::chrono::duration<double>(t1 - t0).count() << " s\n";
    std::cout << "Total RSS: " << get_memory_usage_mb() << " MB\n";
    print_separator();

    if (graph.vertex_count() < 2) {
        std::cerr << "Need at least two airports\n";
        return 1;
    }

    std::mt19937 rng(seed);
    std::uniform_int_distribution<uint32_t> pick(0, static_cast<uint32_t>(graph.vertex_count() - 1));
    RoutePlanner planner(graph);

    double array_ms = 0.0, heap_ms = 0.0;
    OperationCounters array_ops, heap_ops;
    int found = 0, mismatches = 0;

    for (int q = 0; q < queries; ++q) {
        uint32_t s = pick(rng), t = pick(rng);
        if (s == t) continue;

        auto cmp = planner.compare_dijkstra_implementations(graph.airport(s).code, graph.airport(t).code,
                                                            WeightMode::PRICE);
        array_ms += cmp.array_based.execution_time_ms;
        heap_ms += cmp.heap_based.execution_time_ms;
        array_ops.extract_min_ops += cmp.array_based.ops.extract_min_ops;
        array_ops.comparisons += cmp.array_based.ops.comparisons;
        heap_ops.extract_min_ops += cmp.heap_based.ops.extract_min_ops;
        heap_ops.comparisons += cmp.heap_based.ops.comparisons;
        heap_ops.heap_operations += cmp.heap_based.ops.heap_operations;

        if (cmp.heap_based.found) found++;
        if (cmp.array_based.found != cmp.heap_based.found ||
            cmp.array_based.came_from != cmp.heap_based.came_from) {
            mismatches++;
        }
    }

    std::cout << "RESULTS (" << queries << " queries, " << found << " routes found):\n";
    std::cout << "  Array  O(V^2):          " << array_ms << " ms, "
              << array_ops.extract_min_ops << " extract-min, " << array_ops.comparisons << " comparisons\n";
    std::cout << "  Heap   O((V + E) log V): " << heap_ms << " ms, "
              << heap_ops.extract_min_ops << " extract-min, " << heap_ops.comparisons << " comparisons, "
              << heap_ops.heap_operations << " heap ops\n";
    std::cout << "  Speedup (array/heap):   " << (heap_ms > 0 ? array_ms / heap_ms : 0.0) << "x\n";
    std::cout << "  Peak RSS:               " << get_memory_usage_mb() << " MB\n";
    print_separator();

    if (mismatches > 0) {
        std::cerr << mismatches << " queries where the strategies disagree\n";
        return 1;
    }
    return 0;
}
