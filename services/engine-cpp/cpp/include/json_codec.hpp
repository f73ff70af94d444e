/**
 * @file json_codec.hpp
 * @brief nlohmann/json serialization of engine results for the HTTP API.
 *
 * The to_json overloads live in flight_routing so nlohmann finds them
 * through ADL: `json j = route;`.
 */

#pragma once

#include "airport_locator.hpp"
#include "graph_analyzer.hpp"
#include "mst_engine.hpp"
#include "pareto_finder.hpp"
#include "route_planner.hpp"
#include "shortest_path.hpp"
#include "step_recorder.hpp"

#include <nlohmann/json.hpp>

namespace flight_routing {

using json = nlohmann::json;

void to_json(json& j, const Airport& a);
void to_json(json& j, const FlightEdge& f);
void to_json(json& j, const Route& r);
void to_json(json& j, const OperationCounters& ops);
void to_json(json& j, const SearchState& s);
void to_json(json& j, const MSTEdge& e);
void to_json(json& j, const MSTState& s);
void to_json(json& j, const GraphStats& s);
void to_json(json& j, const AdjacencyEntry& e);
void to_json(json& j, const AdjacencyMatrix& m);
void to_json(json& j, const ComponentsResult& c);
void to_json(json& j, const Connectivity& c);
void to_json(json& j, const RouteSubgraph& s);
void to_json(json& j, const ParetoResult& p);
void to_json(json& j, const AlgorithmComparison& c);
void to_json(json& j, const NearbyAirport& n);

/// Route or null.
json optional_route(const std::optional<Route>& route);

/// Per-strategy block of a compare-performance response.
json implementation_json(const ShortestPathResult& result);

json implementation_comparison_json(const ImplementationComparison& cmp);

json mst_result_json(const MSTResult& result);

}  // namespace flight_routing
