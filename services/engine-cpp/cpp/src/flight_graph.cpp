/**
 * @file flight_graph.cpp
 * @brief FlightGraph construction (CSR) and mode-weighted adjacency.
 */

#include "flight_graph.hpp"
#include "engine_errors.hpp"
#include "geo_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace flight_routing {

const char* weight_mode_name(WeightMode mode) {
    switch (mode) {
        case WeightMode::PRICE: return "price";
        case WeightMode::DURATION: return "duration";
        case WeightMode::DISTANCE: return "distance";
    }
    return "unknown";
}

bool is_valid_airport_code(const std::string& code) {
    if (code.size() < 2 || code.size() > 4) return false;
    return std::all_of(code.begin(), code.end(),
                       [](unsigned char c) { return c >= 'A' && c <= 'Z'; });
}

std::string normalize_airport_code(const std::string& raw) {
    size_t first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = raw.find_last_not_of(" \t\r\n");

    std::string code = raw.substr(first, last - first + 1);
    for (auto& c : code) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return code;
}

// ============================================================
// BUILD
// ============================================================

// Prefix sum of per-vertex counts into a CSR offset array (size n + 1)
static std::vector<uint32_t> build_offsets(const std::vector<uint32_t>& counts) {
    std::vector<uint32_t> offsets(counts.size() + 1, 0);
    uint32_t offset = 0;
    for (size_t i = 0; i < counts.size(); ++i) {
        offsets[i] = offset;
        offset += counts[i];
    }
    offsets[counts.size()] = offset;
    return offsets;
}

FlightGraph FlightGraph::build(std::vector<Airport> airports, const std::vector<FlightEdge>& flights) {
    FlightGraph g;

    for (const auto& a : airports) {
        if (!is_valid_airport_code(a.code)) {
            throw ValidationError("Invalid airport code '" + a.code + "'");
        }
        if (!std::isfinite(a.latitude) || !std::isfinite(a.longitude)) {
            throw ValidationError("Airport " + a.code + " has non-finite coordinates");
        }
    }

    std::sort(airports.begin(), airports.end(),
              [](const Airport& a, const Airport& b) { return a.code < b.code; });
    for (size_t i = 0; i + 1 < airports.size(); ++i) {
        if (airports[i].code == airports[i + 1].code) {
            throw ValidationError("Duplicate airport code '" + airports[i].code + "'");
        }
    }

    g.airports_ = std::move(airports);
    for (uint32_t i = 0; i < g.airports_.size(); ++i) {
        g.code_index_[g.airports_[i].code] = i;
    }

    g.edges_.reserve(flights.size());
    for (const auto& f : flights) {
        if (f.price < 0 || !std::isfinite(f.price)) {
            throw ValidationError("Flight " + f.flight_no + " has invalid price");
        }
        if (f.duration_min < 0) {
            throw ValidationError("Flight " + f.flight_no + " has negative duration");
        }

        auto src = g.find_airport(f.source);
        auto dst = g.find_airport(f.dest);
        if (!src || !dst || *src == *dst) {
            g.skipped_flights_++;
            continue;
        }

        FlightEdge e = f;
        e.id = static_cast<uint32_t>(g.edges_.size());
        e.from = *src;
        e.to = *dst;
        g.edges_.push_back(std::move(e));
    }

    if (g.skipped_flights_ > 0) {
        std::cerr << "FlightGraph: skipped " << g.skipped_flights_
                  << " flights with unknown endpoints or self-loops" << std::endl;
    }

    const size_t n = g.airports_.size();

    // Forward CSR
    std::vector<uint32_t> counts(n, 0);
    for (const auto& e : g.edges_) counts[e.from]++;
    g.fwd_offsets_ = build_offsets(counts);
    g.fwd_edges_.resize(g.edges_.size());
    std::vector<uint32_t> current_pos(g.fwd_offsets_.begin(), g.fwd_offsets_.end() - 1);
    for (const auto& e : g.edges_) {
        g.fwd_edges_[current_pos[e.from]++] = e.id;
    }

    // Backward CSR
    std::fill(counts.begin(), counts.end(), 0);
    for (const auto& e : g.edges_) counts[e.to]++;
    g.bwd_offsets_ = build_offsets(counts);
    g.bwd_edges_.resize(g.edges_.size());
    current_pos.assign(g.bwd_offsets_.begin(), g.bwd_offsets_.end() - 1);
    for (const auto& e : g.edges_) {
        g.bwd_edges_[current_pos[e.to]++] = e.id;
    }

    return g;
}

// ============================================================
// ACCESSORS
// ============================================================

std::optional<uint32_t> FlightGraph::find_airport(const std::string& code) const {
    auto it = code_index_.find(code);
    if (it == code_index_.end()) return std::nullopt;
    return it->second;
}

uint32_t FlightGraph::require_airport(const std::string& code) const {
    auto v = find_airport(code);
    if (!v) throw UnknownAirport(code);
    return *v;
}

std::vector<uint32_t> FlightGraph::out_edges(uint32_t v) const {
    return {fwd_edges_.begin() + fwd_offsets_[v], fwd_edges_.begin() + fwd_offsets_[v + 1]};
}

std::vector<uint32_t> FlightGraph::in_edges(uint32_t v) const {
    return {bwd_edges_.begin() + bwd_offsets_[v], bwd_edges_.begin() + bwd_offsets_[v + 1]};
}

std::vector<const FlightEdge*> FlightGraph::neighbors(const std::string& code, WeightMode mode) const {
    uint32_t v = require_airport(code);
    WeightedAdjacency adj(*this, weight_fn(mode));

    std::vector<const FlightEdge*> result;
    result.reserve(adj.arcs(v).size());
    for (const auto& arc : adj.arcs(v)) {
        result.push_back(&edges_[arc.edge]);
    }
    return result;
}

double FlightGraph::edge_distance_km(const FlightEdge& edge) const {
    const Airport& a = airports_[edge.from];
    const Airport& b = airports_[edge.to];
    return geo_utils::great_circle_km(a.latitude, a.longitude, b.latitude, b.longitude);
}

double FlightGraph::edge_weight(const FlightEdge& edge, WeightMode mode) const {
    switch (mode) {
        case WeightMode::PRICE: return edge.price;
        case WeightMode::DURATION: return static_cast<double>(edge.duration_min);
        case WeightMode::DISTANCE: return edge_distance_km(edge);
    }
    return edge.price;
}

WeightFn FlightGraph::weight_fn(WeightMode mode) const {
    return [this, mode](const FlightEdge& e) { return edge_weight(e, mode); };
}

// ============================================================
// WEIGHTED ADJACENCY
// ============================================================

WeightedAdjacency::WeightedAdjacency(const FlightGraph& graph, const WeightFn& weight) {
    arcs_.resize(graph.vertex_count());

    for (uint32_t v = 0; v < graph.vertex_count(); ++v) {
        auto& list = arcs_[v];
        for (uint32_t e : graph.out_edges(v)) {
            const FlightEdge& edge = graph.edge(e);
            double w = weight(edge);
            if (std::isnan(w) || w < 0) {
                throw InvariantViolation("Edge " + edge.source + "->" + edge.dest + " (" +
                                         edge.flight_no + ") has invalid weight " + std::to_string(w));
            }
            list.push_back({e, edge.to, w});
        }
        // Vertex indices follow code order, so comparing `to` compares codes
        std::sort(list.begin(), list.end(), [](const Arc& a, const Arc& b) {
            if (a.weight != b.weight) return a.weight < b.weight;
            if (a.to != b.to) return a.to < b.to;
            return a.edge < b.edge;
        });
    }
}

}  // namespace flight_routing
