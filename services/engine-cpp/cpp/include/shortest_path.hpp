/**
 * @file shortest_path.hpp
 * @brief Array-based and heap-based Dijkstra over a FlightGraph.
 *
 * Both strategies finalize vertices in (tentative cost, airport code) order
 * and relax arcs in WeightedAdjacency order, replacing a best-known cost only
 * on strict improvement. For the same graph and weight they therefore produce
 * identical distance and came_from maps.
 */

#pragma once

#include "flight_graph.hpp"
#include "step_recorder.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace flight_routing {

enum class DijkstraStrategy {
    ARRAY,  ///< O(V^2) linear scan for the minimum
    HEAP    ///< O((V + E) log V) binary heap, lazy decrease-key
};

const char* strategy_name(DijkstraStrategy strategy);

/**
 * @brief Operation counts for comparing the two strategies.
 */
struct OperationCounters {
    uint64_t extract_min_ops = 0;
    uint64_t relax_ops = 0;
    uint64_t comparisons = 0;
    uint64_t heap_operations = 0;  ///< Pushes + pops (heap strategy only)
};

struct SearchStats {
    size_t nodes_explored = 0;
    size_t edges_checked = 0;
    double time_ms = 0.0;
};

/**
 * @brief Itinerary: airports visited and flights taken.
 */
struct Route {
    std::vector<std::string> path;
    std::vector<FlightEdge> legs;
    std::vector<std::pair<double, double>> coords;  ///< (lat, lon) per path airport
    double total_price = 0.0;
    int total_duration_min = 0;
    double total_distance_km = 0.0;
    int stops = 0;
    SearchStats stats;
};

/**
 * @brief Build a route from consecutive flights. Totals are sums over legs.
 *
 * Throws InvariantViolation if the legs are empty or do not chain.
 */
Route build_route(const FlightGraph& graph, const std::vector<uint32_t>& leg_edges);

struct ShortestPathResult {
    bool found = false;
    Route route;
    std::string error;
    double cost = 0.0;  ///< Total weight under the weight function used
    std::map<std::string, double> distances;
    std::map<std::string, std::string> came_from;
    OperationCounters ops;
    double execution_time_ms = 0.0;
    size_t vertices = 0;
    size_t edges = 0;
};

struct SimulationResult {
    ShortestPathResult result;
    std::vector<SearchState> states;
    bool truncated = false;  ///< Snapshots were dropped at the cap
};

/**
 * @brief Walk came_from back from dest to source.
 *
 * Returns an empty path if dest is absent (unreachable). Throws
 * InvariantViolation if the chain cycles or ends before reaching source.
 */
std::vector<std::string> reconstruct_path(const std::map<std::string, std::string>& came_from,
                                          const std::string& source,
                                          const std::string& dest);

class ShortestPathEngine {
public:
    explicit ShortestPathEngine(DijkstraStrategy strategy = DijkstraStrategy::HEAP)
        : strategy_(strategy) {}

    DijkstraStrategy strategy() const { return strategy_; }

    /**
     * @brief Route from source to dest minimizing the mode weight.
     *
     * Throws ValidationError if source == dest, UnknownAirport for codes not
     * in the graph. An unreachable destination yields found == false.
     */
    ShortestPathResult solve(const FlightGraph& graph,
                             const std::string& source,
                             const std::string& dest,
                             WeightMode mode,
                             SearchObserver* observer = nullptr) const;

    ShortestPathResult solve(const FlightGraph& graph,
                             const std::string& source,
                             const std::string& dest,
                             const WeightFn& weight,
                             SearchObserver* observer = nullptr) const;

    ShortestPathResult solve(const FlightGraph& graph,
                             const WeightedAdjacency& adjacency,
                             uint32_t source,
                             uint32_t dest,
                             SearchObserver* observer = nullptr) const;

    /// solve() with a StepRecorder capped at max_states.
    SimulationResult simulate(const FlightGraph& graph,
                              const std::string& source,
                              const std::string& dest,
                              WeightMode mode,
                              size_t max_states) const;

private:
    DijkstraStrategy strategy_;
};

}  // namespace flight_routing
