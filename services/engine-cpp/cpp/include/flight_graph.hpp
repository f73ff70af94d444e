/**
 * @file flight_graph.hpp
 * @brief Immutable airport/flight multigraph with CSR adjacency.
 *
 * Vertices are airports indexed in ascending code order, so comparing vertex
 * indices is the same as comparing airport codes. Edges are flights; parallel
 * edges between the same ordered pair are kept.
 *
 * Memory layout for CSR forward adjacency:
 *   fwd_offsets_[u] to fwd_offsets_[u+1] is the range of fwd_edges_ leaving u
 * Backward adjacency mirrors it for edges entering v.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace flight_routing {

/**
 * @brief Airport record. Identity is the code.
 */
struct Airport {
    std::string code;
    std::string name;
    std::string city;
    std::string country;
    double latitude = 0.0;
    double longitude = 0.0;
};

/**
 * @brief Directed flight between two airports.
 */
struct FlightEdge {
    uint32_t id = 0;              ///< Index into FlightGraph::edges()
    uint32_t from = 0;            ///< Source vertex index
    uint32_t to = 0;              ///< Destination vertex index
    std::string source;           ///< Source airport code
    std::string dest;             ///< Destination airport code
    std::string airline;
    std::string flight_no;
    int duration_min = 0;
    double price = 0.0;
    std::string departure_time;   ///< Empty when unknown
    std::string arrival_time;     ///< Empty when unknown
};

/**
 * @brief Optimization criterion used to weight edges.
 */
enum class WeightMode {
    PRICE,
    DURATION,
    DISTANCE
};

const char* weight_mode_name(WeightMode mode);

/// Edge weight accessor. Must return a finite value >= 0.
using WeightFn = std::function<double(const FlightEdge&)>;

/**
 * @brief Read-only flight network snapshot for one dataset.
 */
class FlightGraph {
public:
    /**
     * @brief Build a graph from raw records.
     *
     * Throws ValidationError on malformed airports (bad or duplicate code,
     * non-finite coordinates) and on flights with negative price/duration.
     * Flights referencing unknown airports and self-loops are skipped and
     * counted in skipped_flights().
     */
    static FlightGraph build(std::vector<Airport> airports, const std::vector<FlightEdge>& flights);

    // ========== LOOKUP ==========

    std::optional<uint32_t> find_airport(const std::string& code) const;

    /// Index of an airport; throws UnknownAirport if absent.
    uint32_t require_airport(const std::string& code) const;

    const Airport& airport(uint32_t v) const { return airports_[v]; }
    const std::vector<Airport>& airports() const { return airports_; }
    const FlightEdge& edge(uint32_t e) const { return edges_[e]; }
    const std::vector<FlightEdge>& edges() const { return edges_; }

    size_t vertex_count() const { return airports_.size(); }
    size_t edge_count() const { return edges_.size(); }
    size_t skipped_flights() const { return skipped_flights_; }

    // ========== ADJACENCY ==========

    /// Edge ids leaving v, in insertion order.
    std::vector<uint32_t> out_edges(uint32_t v) const;

    /// Edge ids entering v, in insertion order.
    std::vector<uint32_t> in_edges(uint32_t v) const;

    size_t out_degree(uint32_t v) const { return fwd_offsets_[v + 1] - fwd_offsets_[v]; }
    size_t in_degree(uint32_t v) const { return bwd_offsets_[v + 1] - bwd_offsets_[v]; }

    /**
     * @brief Outgoing flights of an airport ordered by mode weight, then
     * destination code, then edge id.
     */
    std::vector<const FlightEdge*> neighbors(const std::string& code, WeightMode mode) const;

    // ========== WEIGHTS ==========

    /// Great-circle distance between the endpoints of an edge (km).
    double edge_distance_km(const FlightEdge& edge) const;

    double edge_weight(const FlightEdge& edge, WeightMode mode) const;

    /// Weight function bound to this graph; the graph must outlive it.
    WeightFn weight_fn(WeightMode mode) const;

private:
    std::vector<Airport> airports_;
    std::unordered_map<std::string, uint32_t> code_index_;
    std::vector<FlightEdge> edges_;

    std::vector<uint32_t> fwd_offsets_;
    std::vector<uint32_t> fwd_edges_;
    std::vector<uint32_t> bwd_offsets_;
    std::vector<uint32_t> bwd_edges_;

    size_t skipped_flights_ = 0;
};

/**
 * @brief Outgoing arcs of every vertex under one weight function, each list
 * sorted by (weight, destination code, edge id).
 *
 * Built once per (graph, weight) pair and shared by both Dijkstra strategies
 * so they relax arcs in exactly the same order.
 */
class WeightedAdjacency {
public:
    struct Arc {
        uint32_t edge;
        uint32_t to;
        double weight;
    };

    /// Throws InvariantViolation if the weight function yields a negative or NaN weight.
    WeightedAdjacency(const FlightGraph& graph, const WeightFn& weight);

    const std::vector<Arc>& arcs(uint32_t v) const { return arcs_[v]; }
    size_t vertex_count() const { return arcs_.size(); }

private:
    std::vector<std::vector<Arc>> arcs_;
};

/// Airport codes are 2-4 uppercase ASCII letters.
bool is_valid_airport_code(const std::string& code);

/// Trim surrounding whitespace and upper-case (" lhe " -> "LHE").
std::string normalize_airport_code(const std::string& raw);

}  // namespace flight_routing
