/**
 * @file query_params.hpp
 * @brief Validation of HTTP query parameters.
 *
 * Raw values are passed as nullable C strings, the way Crow's
 * `url_params.get()` returns them. Every failure throws ValidationError
 * with a message naming the parameter.
 */

#pragma once

#include "flight_graph.hpp"
#include "mst_engine.hpp"
#include "shortest_path.hpp"

#include <cstddef>
#include <string>

namespace flight_routing {

/**
 * @brief Bounds for recorded visualization traces.
 */
struct TraceLimits {
    size_t default_states = 300;
    size_t max_states = 5000;  ///< Hard ceiling, requests above it are rejected
};

/// Required airport code, normalized ("lhe " -> "LHE").
std::string require_airport_param(const char* raw, const char* name);

/// Optional integer in [min_value, max_value]; default when absent.
int parse_int_param(const char* raw, const char* name, int default_value, int min_value, int max_value);

/// Required finite number.
double require_double_param(const char* raw, const char* name);

/// Optional finite number; default when absent.
double parse_double_param(const char* raw, const char* name, double default_value);

/// "true"/"1"/"yes" or "false"/"0"/"no"; default when absent.
bool parse_bool_param(const char* raw, const char* name, bool default_value);

/// max_states in [1, limits.max_states]; limits.default_states when absent.
size_t parse_max_states(const char* raw, const TraceLimits& limits);

/// cheapest|price, fastest|duration, shortest|distance. Default cheapest.
WeightMode parse_weight_mode(const char* raw);

/// array|heap. Default heap.
DijkstraStrategy parse_strategy(const char* raw);

/// prim|kruskal. Default prim.
MSTAlgorithm parse_mst_algorithm(const char* raw);

/// route|full. Default route.
MSTScope parse_mst_scope(const char* raw);

}  // namespace flight_routing
