/**
 * @file pareto_finder.cpp
 * @brief Candidate collection and dominance filtering.
 */

#include "pareto_finder.hpp"
#include "engine_errors.hpp"
#include "route_planner.hpp"

namespace flight_routing {

bool dominates(const Route& a, const Route& b) {
    bool no_worse = a.total_price <= b.total_price &&
                    a.total_duration_min <= b.total_duration_min &&
                    a.total_distance_km <= b.total_distance_km;
    bool strictly_better = a.total_price < b.total_price ||
                           a.total_duration_min < b.total_duration_min ||
                           a.total_distance_km < b.total_distance_km;
    return no_worse && strictly_better;
}

ParetoRouteFinder::ParetoRouteFinder(ParetoOptions options) : options_(options) {
    if (options_.max_stops < 0 || options_.max_stops > MAX_STOPS) {
        throw ValidationError("max_stops must be between 0 and " + std::to_string(MAX_STOPS));
    }
}

ParetoResult ParetoRouteFinder::find(const FlightGraph& graph,
                                     const std::string& source,
                                     const std::string& dest) const {
    ParetoResult result;
    std::vector<ParetoCandidate>& candidates = result.all_candidates;

    // One candidate per airport sequence
    auto offer = [&candidates](Route route, const char* origin) {
        for (auto& existing : candidates) {
            if (existing.route.path != route.path) continue;
            if (dominates(route, existing.route)) {
                existing.route = std::move(route);
                existing.origin = origin;
            }
            return;
        }
        candidates.push_back({std::move(route), origin, false});
    };

    ShortestPathEngine engine(DijkstraStrategy::HEAP);
    const std::pair<WeightMode, const char*> optima[] = {
        {WeightMode::PRICE, "cheapest"},
        {WeightMode::DURATION, "fastest"},
        {WeightMode::DISTANCE, "shortest"},
    };
    for (const auto& [mode, origin] : optima) {
        ShortestPathResult r = engine.solve(graph, source, dest, mode);
        if (r.found) offer(std::move(r.route), origin);
    }

    if (options_.enumerate_stops) {
        RoutePlanner planner(graph);
        for (auto& route : planner.enumerate_routes(source, dest, options_.max_stops)) {
            offer(std::move(route), "enumerated");
        }
    }

    for (auto& candidate : candidates) {
        bool dominated = false;
        for (const auto& other : candidates) {
            if (&other != &candidate && dominates(other.route, candidate.route)) {
                dominated = true;
                break;
            }
        }
        candidate.pareto_optimal = !dominated;
        if (!dominated) result.pareto_routes.push_back(candidate.route);
    }

    result.total_candidates = candidates.size();
    result.pareto_count = result.pareto_routes.size();
    return result;
}

}  // namespace flight_routing
