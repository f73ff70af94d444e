/**
 * @file route_planner.cpp
 * @brief Route modes, DFS enumeration, composite weights and comparisons.
 */

#include "route_planner.hpp"
#include "engine_errors.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <limits>

namespace flight_routing {

RouteMode parse_route_mode(const std::string& name) {
    std::string s;
    for (char c : name) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (s == "all") return RouteMode::ALL;
    if (s == "cheapest") return RouteMode::CHEAPEST;
    if (s == "fastest") return RouteMode::FASTEST;
    if (s == "shortest") return RouteMode::SHORTEST;
    if (s == "best_overall") return RouteMode::BEST_OVERALL;
    if (s == "pareto") return RouteMode::PARETO;
    throw ValidationError("optimization must be one of all, best_overall, cheapest, fastest, pareto, shortest");
}

const char* route_mode_name(RouteMode mode) {
    switch (mode) {
        case RouteMode::ALL: return "all";
        case RouteMode::CHEAPEST: return "cheapest";
        case RouteMode::FASTEST: return "fastest";
        case RouteMode::SHORTEST: return "shortest";
        case RouteMode::BEST_OVERALL: return "best_overall";
        case RouteMode::PARETO: return "pareto";
    }
    return "unknown";
}

// ============================================================
// COMPOSITE WEIGHT
// ============================================================

namespace {

struct Range {
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();

    void add(double x) {
        lo = std::min(lo, x);
        hi = std::max(hi, x);
    }
    // Degenerate range normalizes by 1
    double span() const { return hi > lo ? hi - lo : 1.0; }
};

}  // namespace

WeightFn composite_weight_fn(const FlightGraph& graph, CompositeWeights weights) {
    double total = weights.price + weights.duration + weights.distance;
    if (total > 0) {
        weights.price /= total;
        weights.duration /= total;
        weights.distance /= total;
    } else {
        weights.price = weights.duration = weights.distance = 1.0 / 3.0;
    }

    Range price, duration, distance;
    for (const auto& e : graph.edges()) {
        price.add(e.price);
        duration.add(e.duration_min);
        distance.add(graph.edge_distance_km(e));
    }
    if (graph.edge_count() == 0) {
        return [](const FlightEdge&) { return 0.0; };
    }

    return [&graph, weights, price, duration, distance](const FlightEdge& e) {
        double np = (e.price - price.lo) / price.span();
        double nt = (e.duration_min - duration.lo) / duration.span();
        double nd = (graph.edge_distance_km(e) - distance.lo) / distance.span();
        return np * weights.price + nt * weights.duration + nd * weights.distance;
    };
}

// ============================================================
// ROUTES
// ============================================================

std::optional<Route> RoutePlanner::solve(const std::string& source,
                                         const std::string& dest,
                                         const WeightFn& weight) const {
    ShortestPathEngine engine(DijkstraStrategy::HEAP);
    ShortestPathResult r = engine.solve(graph_, source, dest, weight);
    if (!r.found) return std::nullopt;
    return r.route;
}

std::optional<Route> RoutePlanner::find_route(const std::string& source,
                                              const std::string& dest,
                                              RouteMode mode) const {
    switch (mode) {
        case RouteMode::CHEAPEST: return solve(source, dest, graph_.weight_fn(WeightMode::PRICE));
        case RouteMode::FASTEST: return solve(source, dest, graph_.weight_fn(WeightMode::DURATION));
        case RouteMode::SHORTEST: return solve(source, dest, graph_.weight_fn(WeightMode::DISTANCE));
        case RouteMode::BEST_OVERALL: return solve(source, dest, composite_weight_fn(graph_));
        case RouteMode::ALL:
        case RouteMode::PARETO:
            break;
    }
    throw ValidationError(std::string("Mode ") + route_mode_name(mode) + " returns several routes");
}

std::vector<Route> RoutePlanner::enumerate_routes(const std::string& source,
                                                  const std::string& dest,
                                                  int max_stops) const {
    if (max_stops < 0 || max_stops > MAX_STOPS) {
        throw ValidationError("max_stops must be between 0 and " + std::to_string(MAX_STOPS));
    }
    uint32_t s = graph_.require_airport(source);
    uint32_t t = graph_.require_airport(dest);
    if (s == t) {
        throw ValidationError("Source and destination must differ");
    }

    std::vector<Route> routes;
    std::vector<char> on_path(graph_.vertex_count(), 0);
    std::vector<uint32_t> legs;
    const size_t max_legs = static_cast<size_t>(max_stops) + 1;

    std::function<void(uint32_t)> dfs = [&](uint32_t u) {
        if (u == t) {
            routes.push_back(build_route(graph_, legs));
            return;
        }
        if (legs.size() == max_legs) return;

        for (uint32_t e : graph_.out_edges(u)) {
            uint32_t w = graph_.edge(e).to;
            if (on_path[w]) continue;
            on_path[w] = 1;
            legs.push_back(e);
            dfs(w);
            legs.pop_back();
            on_path[w] = 0;
        }
    };

    on_path[s] = 1;
    dfs(s);
    return routes;
}

AlgorithmComparison RoutePlanner::compare_all_algorithms(const std::string& source,
                                                         const std::string& dest) const {
    AlgorithmComparison cmp;
    cmp.cheapest = find_route(source, dest, RouteMode::CHEAPEST);
    cmp.fastest = find_route(source, dest, RouteMode::FASTEST);
    cmp.shortest = find_route(source, dest, RouteMode::SHORTEST);

    std::vector<std::pair<const char*, const Route*>> found;
    if (cmp.cheapest) found.push_back({"cheapest", &*cmp.cheapest});
    if (cmp.fastest) found.push_back({"fastest", &*cmp.fastest});
    if (cmp.shortest) found.push_back({"shortest", &*cmp.shortest});
    if (found.empty()) return cmp;

    Range price, duration, distance;
    for (const auto& [name, r] : found) {
        price.add(r->total_price);
        duration.add(r->total_duration_min);
        distance.add(r->total_distance_km);
    }

    // Degenerate metric scores 0.5 for every route
    auto norm = [](double x, const Range& range) {
        return range.hi > range.lo ? (x - range.lo) / (range.hi - range.lo) : 0.5;
    };

    double best = std::numeric_limits<double>::infinity();
    for (const auto& [name, r] : found) {
        double score = norm(r->total_price, price) * 0.40 +
                       norm(r->total_duration_min, duration) * 0.35 +
                       norm(r->total_distance_km, distance) * 0.25;
        if (score < best) {
            best = score;
            cmp.best_overall = *r;
            cmp.algorithm_used = name;
        }
    }
    cmp.best_score = best;
    return cmp;
}

// ============================================================
// SIMULATION
// ============================================================

SimulationResult RoutePlanner::simulate_dijkstra(const std::string& source,
                                                 const std::string& dest,
                                                 WeightMode mode,
                                                 size_t max_states,
                                                 DijkstraStrategy strategy) const {
    return ShortestPathEngine(strategy).simulate(graph_, source, dest, mode, max_states);
}

ImplementationComparison RoutePlanner::compare_dijkstra_implementations(const std::string& source,
                                                                        const std::string& dest,
                                                                        WeightMode mode) const {
    uint32_t s = graph_.require_airport(source);
    uint32_t t = graph_.require_airport(dest);
    if (s == t) {
        throw ValidationError("Source and destination must differ");
    }

    WeightedAdjacency adjacency(graph_, graph_.weight_fn(mode));

    ImplementationComparison cmp;
    cmp.array_based = ShortestPathEngine(DijkstraStrategy::ARRAY).solve(graph_, adjacency, s, t);
    cmp.heap_based = ShortestPathEngine(DijkstraStrategy::HEAP).solve(graph_, adjacency, s, t);

    double heap_ms = cmp.heap_based.execution_time_ms;
    cmp.speedup = heap_ms > 0 ? cmp.array_based.execution_time_ms / heap_ms : 0.0;
    return cmp;
}

}  // namespace flight_routing
