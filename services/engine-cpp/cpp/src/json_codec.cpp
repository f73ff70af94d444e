/**
 * @file json_codec.cpp
 * @brief JSON field layout of API responses.
 */

#include "json_codec.hpp"

#include <cmath>

namespace flight_routing {

static double round2(double x) {
    return std::round(x * 100.0) / 100.0;
}

static json nullable(const std::optional<std::string>& s) {
    return s ? json(*s) : json(nullptr);
}

void to_json(json& j, const Airport& a) {
    j = {
        {"code", a.code},
        {"name", a.name},
        {"city", a.city},
        {"country", a.country},
        {"latitude", a.latitude},
        {"longitude", a.longitude}
    };
}

void to_json(json& j, const FlightEdge& f) {
    j = {
        {"airline", f.airline},
        {"flight_no", f.flight_no},
        {"from", f.source},
        {"to", f.dest},
        {"departure_time", f.departure_time.empty() ? json(nullptr) : json(f.departure_time)},
        {"arrival_time", f.arrival_time.empty() ? json(nullptr) : json(f.arrival_time)},
        {"durationMin", f.duration_min},
        {"priceUSD", f.price}
    };
}

void to_json(json& j, const Route& r) {
    json coords = json::array();
    for (const auto& [lat, lon] : r.coords) coords.push_back({lat, lon});

    j = {
        {"path", r.path},
        {"legs", r.legs},
        {"coords", coords},
        {"totalPriceUSD", r.total_price},
        {"totalDurationMin", r.total_duration_min},
        {"totalDistanceKM", round2(r.total_distance_km)},
        {"stops", r.stops},
        {"stats", {
            {"nodes_explored", r.stats.nodes_explored},
            {"edges_checked", r.stats.edges_checked},
            {"time_ms", r.stats.time_ms}
        }}
    };
}

void to_json(json& j, const OperationCounters& ops) {
    j = {
        {"extract_min_ops", ops.extract_min_ops},
        {"relax_ops", ops.relax_ops},
        {"comparisons", ops.comparisons},
        {"heap_operations", ops.heap_operations}
    };
}

void to_json(json& j, const SearchState& s) {
    json pq = json::array();
    for (const auto& [code, cost] : s.frontier) pq.push_back({code, cost});

    json relax = nullptr;
    if (s.relax) {
        relax = {
            {"edge", {{"from", s.relax->from}, {"to", s.relax->to}, {"flight_no", s.relax->flight_no}}},
            {"updated", s.relax->updated},
            {"new_cost", s.relax->new_cost ? json(*s.relax->new_cost) : json(nullptr)}
        };
    }

    j = {
        {"step", s.step},
        {"event", search_event_name(s.event)},
        {"time_ms", s.time_ms},
        {"current", nullable(s.current)},
        {"pq", pq},
        {"distances", s.distances},
        {"visited", s.visited},
        {"came_from", s.came_from},
        {"relax", relax}
    };
}

void to_json(json& j, const MSTEdge& e) {
    j = {
        {"from", e.from},
        {"to", e.to},
        {"weight", e.weight},
        {"flight_no", e.flight_no}
    };
}

void to_json(json& j, const MSTState& s) {
    j = {
        {"step", s.step},
        {"event", mst_event_name(s.event)},
        {"current_node", nullable(s.current_node)},
        {"visited", s.visited},
        {"mst_edges", s.mst_edges},
        {"current_edge", s.current_edge ? json(*s.current_edge) : json(nullptr)},
        {"total_weight", s.total_weight}
    };
}

void to_json(json& j, const GraphStats& s) {
    j = {
        {"vertices", s.vertices},
        {"edges", s.edges},
        {"density", s.density},
        {"avg_degree", s.avg_degree},
        {"min_degree", s.min_degree},
        {"max_degree", s.max_degree}
    };
}

void to_json(json& j, const AdjacencyEntry& e) {
    j = {
        {"to", e.to},
        {"flight_no", e.flight_no},
        {"price", e.price},
        {"duration", e.duration_min}
    };
}

void to_json(json& j, const AdjacencyMatrix& m) {
    j = {
        {"airports", m.airports},
        {"matrix", m.matrix}
    };
}

void to_json(json& j, const ComponentsResult& c) {
    j = {
        {"components", c.components},
        {"count", c.components.size()},
        {"largest", c.largest},
        {"is_fully_connected", c.fully_connected}
    };
}

void to_json(json& j, const Connectivity& c) {
    j = {
        {"source", c.source},
        {"dest", c.dest},
        {"reachable", c.reachable},
        {"hops", c.reachable ? json(c.hops) : json(nullptr)},
        {"visit_order", c.visit_order}
    };
}

void to_json(json& j, const RouteSubgraph& s) {
    json edges = json::array();
    for (const auto& e : s.edges) {
        edges.push_back({{"from", e.from}, {"to", e.to}, {"flight_no", e.flight_no}, {"price", e.price}});
    }

    j = {
        {"source", s.source},
        {"dest", s.dest},
        {"max_hops", s.max_hops},
        {"subgraph", {
            {"vertices_count", s.airports.size()},
            {"edges_count", s.edges.size()},
            {"airports", s.airports},
            {"edges", edges}
        }},
        {"path_stats", {
            {"direct_flights", s.direct_flights},
            {"one_stop_options", s.one_stop_options},
            {"two_stop_options", s.two_stop_options},
            {"total_paths", s.total_paths}
        }},
        {"network_context", {
            {"source_degree", s.source_degree},
            {"dest_degree", s.dest_degree},
            {"is_connected", s.is_connected},
            {"subgraph_density", s.subgraph_density}
        }}
    };
}

void to_json(json& j, const ParetoResult& p) {
    json candidates = json::array();
    for (const auto& c : p.all_candidates) {
        json route = c.route;
        route["origin"] = c.origin;
        route["pareto_optimal"] = c.pareto_optimal;
        candidates.push_back(std::move(route));
    }

    j = {
        {"routes", p.pareto_routes},
        {"all_candidates", candidates},
        {"total_candidates", p.total_candidates},
        {"pareto_count", p.pareto_count}
    };
}

json optional_route(const std::optional<Route>& route) {
    return route ? json(*route) : json(nullptr);
}

void to_json(json& j, const AlgorithmComparison& c) {
    j = {
        {"cheapest", optional_route(c.cheapest)},
        {"fastest", optional_route(c.fastest)},
        {"shortest", optional_route(c.shortest)},
        {"best_overall", optional_route(c.best_overall)},
        {"algorithm_used", c.algorithm_used.empty() ? json(nullptr) : json(c.algorithm_used)},
        {"best_score", c.best_score ? json(*c.best_score) : json(nullptr)}
    };
}

void to_json(json& j, const NearbyAirport& n) {
    j = n.airport;
    j["distance_km"] = round2(n.distance_km);
}

json implementation_json(const ShortestPathResult& result) {
    return {
        {"route", result.found ? json(result.route) : json(nullptr)},
        {"execution_time_ms", result.execution_time_ms},
        {"operations", result.ops},
        {"vertices", result.vertices},
        {"edges", result.edges},
        {"found_path", result.found}
    };
}

json implementation_comparison_json(const ImplementationComparison& cmp) {
    return {
        {"array_based", implementation_json(cmp.array_based)},
        {"heap_based", implementation_json(cmp.heap_based)},
        {"comparison", {
            {"speedup", cmp.speedup},
            {"time_complexity_array", cmp.time_complexity_array},
            {"time_complexity_heap", cmp.time_complexity_heap}
        }}
    };
}

json mst_result_json(const MSTResult& result) {
    return {
        {"algorithm", mst_algorithm_name(result.algorithm)},
        {"mst_edges", result.edges},
        {"total_weight", result.total_weight},
        {"airports", result.airports},
        {"connected", result.connected}
    };
}

}  // namespace flight_routing
