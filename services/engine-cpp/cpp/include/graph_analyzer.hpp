/**
 * @file graph_analyzer.hpp
 * @brief Structural views and statistics of the flight network.
 */

#pragma once

#include "flight_graph.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace flight_routing {

struct GraphStats {
    size_t vertices = 0;
    size_t edges = 0;
    double density = 0.0;     ///< E / (V * (V - 1))
    double avg_degree = 0.0;  ///< Out-degree
    size_t min_degree = 0;
    size_t max_degree = 0;
};

struct AdjacencyEntry {
    std::string to;
    std::string flight_no;
    double price = 0.0;
    int duration_min = 0;
};

using AdjacencyList = std::map<std::string, std::vector<AdjacencyEntry>>;

/**
 * @brief Dense V x V view; cell = cheapest i->j price, 0 when no flight.
 */
struct AdjacencyMatrix {
    std::vector<std::string> airports;
    std::vector<std::vector<double>> matrix;
};

struct ComponentsResult {
    std::vector<std::vector<std::string>> components;  ///< Largest first
    size_t largest = 0;
    bool fully_connected = false;
};

struct Connectivity {
    std::string source;
    std::string dest;
    bool reachable = false;
    int hops = -1;  ///< Fewest flights, -1 when unreachable
    std::vector<std::string> visit_order;
};

struct SubgraphEdge {
    uint32_t edge_id = 0;
    std::string from;
    std::string to;
    std::string flight_no;
    double price = 0.0;
};

/**
 * @brief Airports and flights lying on simple source->dest paths of at most
 * max_hops flights, with path counts and network context.
 */
struct RouteSubgraph {
    std::string source;
    std::string dest;
    int max_hops = 3;
    std::vector<std::string> airports;  ///< Sorted, always includes source and dest
    std::vector<SubgraphEdge> edges;    ///< Distinct flights, discovery order

    size_t direct_flights = 0;
    size_t one_stop_options = 0;
    size_t two_stop_options = 0;
    size_t total_paths = 0;

    size_t source_degree = 0;  ///< Out-degree in the full network
    size_t dest_degree = 0;    ///< In-degree in the full network
    double subgraph_density = 0.0;
    bool is_connected = false;  ///< dest reachable from source (unbounded)
};

class GraphAnalyzer {
public:
    explicit GraphAnalyzer(const FlightGraph& graph) : graph_(graph) {}

    GraphStats stats() const;
    AdjacencyList adjacency_list() const;
    AdjacencyMatrix adjacency_matrix() const;

    /// Weakly connected components (flight direction ignored).
    ComponentsResult connected_components() const;

    /// Directed BFS from source.
    Connectivity connectivity(const std::string& source, const std::string& dest) const;
    bool is_reachable(const std::string& source, const std::string& dest) const;

    /// Throws ValidationError unless 1 <= max_hops <= 6 and source != dest.
    RouteSubgraph route_subgraph(const std::string& source, const std::string& dest, int max_hops = 3) const;

private:
    const FlightGraph& graph_;
};

}  // namespace flight_routing
