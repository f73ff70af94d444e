/**
 * @file pareto_finder.hpp
 * @brief Non-dominated itineraries over (price, duration, distance).
 */

#pragma once

#include "flight_graph.hpp"
#include "shortest_path.hpp"

#include <string>
#include <vector>

namespace flight_routing {

/**
 * @brief a dominates b iff a is no worse on price, duration and distance and
 * strictly better on at least one of them.
 */
bool dominates(const Route& a, const Route& b);

struct ParetoOptions {
    bool enumerate_stops = false;  ///< Also consider every simple route up to max_stops
    int max_stops = 2;             ///< 0-4, used only with enumerate_stops
};

struct ParetoCandidate {
    Route route;
    std::string origin;  ///< "cheapest", "fastest", "shortest" or "enumerated"
    bool pareto_optimal = false;
};

struct ParetoResult {
    std::vector<Route> pareto_routes;            ///< Candidate order
    std::vector<ParetoCandidate> all_candidates;  ///< Unique by path
    size_t total_candidates = 0;
    size_t pareto_count = 0;
};

class ParetoRouteFinder {
public:
    explicit ParetoRouteFinder(ParetoOptions options = {});

    /**
     * @brief Collect candidates and keep the non-dominated ones.
     *
     * Throws ValidationError for source == dest or max_stops outside 0-4,
     * UnknownAirport for unknown codes. No route yields an empty result.
     */
    ParetoResult find(const FlightGraph& graph, const std::string& source, const std::string& dest) const;

    const ParetoOptions& options() const { return options_; }

private:
    ParetoOptions options_;
};

}  // namespace flight_routing
