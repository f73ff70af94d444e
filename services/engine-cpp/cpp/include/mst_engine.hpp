/**
 * @file mst_engine.hpp
 * @brief Prim and Kruskal minimum spanning trees over a price-weighted,
 * undirected view of the flight network.
 *
 * Edges are totally ordered by (weight, from code, to code). Both algorithms
 * break ties with that order; with equal weights they may still pick
 * different but equally cheap edge sets.
 */

#pragma once

#include "flight_graph.hpp"
#include "step_recorder.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace flight_routing {

enum class MSTAlgorithm {
    PRIM,
    KRUSKAL
};

/**
 * @brief Which vertices the tree spans.
 */
enum class MSTScope {
    ROUTE,  ///< Airports and flights on source->dest paths (default)
    FULL    ///< Whole network
};

const char* mst_algorithm_name(MSTAlgorithm algorithm);
const char* mst_scope_name(MSTScope scope);

/**
 * @brief Undirected view: one edge per airport pair carrying the minimum
 * price over all flights between them in either direction.
 */
class UndirectedPriceGraph {
public:
    /// Scoped view over the given airports and flights. Flights with an
    /// endpoint outside the airport set are ignored.
    static UndirectedPriceGraph from_flights(const FlightGraph& graph,
                                             std::vector<std::string> airport_codes,
                                             const std::vector<uint32_t>& edge_ids);

    static UndirectedPriceGraph full(const FlightGraph& graph);

    const std::vector<std::string>& vertices() const { return vertices_; }
    /// Sorted by (weight, from, to)
    const std::vector<MSTEdge>& edges() const { return edges_; }
    const std::pair<uint32_t, uint32_t>& endpoints(size_t e) const { return endpoints_[e]; }
    /// Indices into edges() touching v, ascending
    const std::vector<size_t>& incident(uint32_t v) const { return incident_[v]; }

    size_t vertex_count() const { return vertices_.size(); }
    size_t edge_count() const { return edges_.size(); }

    std::optional<uint32_t> index_of(const std::string& code) const;

private:
    std::vector<std::string> vertices_;
    std::vector<MSTEdge> edges_;
    std::vector<std::pair<uint32_t, uint32_t>> endpoints_;
    std::vector<std::vector<size_t>> incident_;
};

/**
 * @brief Disjoint-set forest with path compression and union by rank.
 */
class UnionFind {
public:
    explicit UnionFind(size_t n);

    uint32_t find(uint32_t x);
    /// Returns false if x and y were already in the same set.
    bool unite(uint32_t x, uint32_t y);

private:
    std::vector<uint32_t> parent_;
    std::vector<uint8_t> rank_;
};

struct MSTResult {
    MSTAlgorithm algorithm = MSTAlgorithm::PRIM;
    std::vector<MSTEdge> edges;
    double total_weight = 0.0;
    std::vector<std::string> airports;
    bool connected = false;  ///< edges == airports - 1
};

struct MSTSimulation {
    MSTResult result;
    std::vector<MSTState> states;
    bool truncated = false;
};

class MSTEngine {
public:
    /**
     * @brief Compute the tree (Prim) or forest (Kruskal).
     *
     * Prim starts at start_code, or the first airport by code when empty.
     * Throws ValidationError if the view has no vertices or the start code
     * is not part of it.
     */
    MSTResult solve(const UndirectedPriceGraph& view,
                    MSTAlgorithm algorithm,
                    MSTObserver* observer = nullptr,
                    const std::string& start_code = "") const;

    MSTSimulation simulate(const UndirectedPriceGraph& view,
                           MSTAlgorithm algorithm,
                           size_t max_states,
                           const std::string& start_code = "") const;
};

/**
 * @brief Build the undirected view for an MST query.
 *
 * ROUTE scope uses the route subgraph of (source, dest) within max_hops;
 * FULL scope ignores source/dest apart from validating them.
 */
UndirectedPriceGraph build_mst_view(const FlightGraph& graph,
                                    const std::string& source,
                                    const std::string& dest,
                                    MSTScope scope,
                                    int max_hops = 3);

}  // namespace flight_routing
