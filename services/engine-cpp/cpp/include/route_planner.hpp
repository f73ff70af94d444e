/**
 * @file route_planner.hpp
 * @brief Route query facade: mode dispatch, route enumeration, composite
 * best-overall routing and algorithm comparisons.
 */

#pragma once

#include "flight_graph.hpp"
#include "shortest_path.hpp"

#include <optional>
#include <string>
#include <vector>

namespace flight_routing {

constexpr int MAX_STOPS = 4;

enum class RouteMode {
    ALL,           ///< Enumerate every route up to max_stops
    CHEAPEST,
    FASTEST,
    SHORTEST,      ///< Great-circle distance
    BEST_OVERALL,  ///< Composite weight
    PARETO
};

/// Case-insensitive; throws ValidationError for unknown names.
RouteMode parse_route_mode(const std::string& name);
const char* route_mode_name(RouteMode mode);

/**
 * @brief Weights of the composite best-overall cost. Normalized to sum 1.
 */
struct CompositeWeights {
    double price = 0.40;
    double duration = 0.35;
    double distance = 0.25;
};

/**
 * @brief Per-edge composite cost: weighted sum of each metric min-max
 * normalized over all flights of the graph.
 */
WeightFn composite_weight_fn(const FlightGraph& graph, CompositeWeights weights = {});

struct AlgorithmComparison {
    std::optional<Route> cheapest;
    std::optional<Route> fastest;
    std::optional<Route> shortest;
    std::optional<Route> best_overall;
    std::string algorithm_used;  ///< Empty when no route exists
    std::optional<double> best_score;
};

struct ImplementationComparison {
    ShortestPathResult array_based;
    ShortestPathResult heap_based;
    double speedup = 0.0;  ///< array time / heap time, 0 when heap time is 0
    const char* time_complexity_array = "O(V^2)";
    const char* time_complexity_heap = "O((V + E) log V)";
};

class RoutePlanner {
public:
    explicit RoutePlanner(const FlightGraph& graph) : graph_(graph) {}

    /**
     * @brief Single best route for CHEAPEST, FASTEST, SHORTEST or BEST_OVERALL.
     *
     * Returns nullopt when no route exists. ALL and PARETO are multi-route
     * modes and raise ValidationError here.
     */
    std::optional<Route> find_route(const std::string& source, const std::string& dest, RouteMode mode) const;

    /// Simple paths with at most max_stops intermediate airports (0-4).
    std::vector<Route> enumerate_routes(const std::string& source, const std::string& dest, int max_stops) const;

    AlgorithmComparison compare_all_algorithms(const std::string& source, const std::string& dest) const;

    SimulationResult simulate_dijkstra(const std::string& source,
                                       const std::string& dest,
                                       WeightMode mode,
                                       size_t max_states,
                                       DijkstraStrategy strategy = DijkstraStrategy::HEAP) const;

    ImplementationComparison compare_dijkstra_implementations(const std::string& source,
                                                              const std::string& dest,
                                                              WeightMode mode) const;

private:
    std::optional<Route> solve(const std::string& source, const std::string& dest, const WeightFn& weight) const;

    const FlightGraph& graph_;
};

}  // namespace flight_routing
