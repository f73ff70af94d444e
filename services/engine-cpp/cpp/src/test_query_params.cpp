/**
 * @file test_query_params.cpp
 * @brief Query parameter validation.
 */

#include "engine_errors.hpp"
#include "query_params.hpp"
#include "test_support.hpp"

using namespace flight_routing;
using test_support::TestResult;

int main() {
    TestResult t;

    t.check(require_airport_param(" lhe ", "source") == "LHE", "airport code normalized");
    t.check_throws<ValidationError>([] { require_airport_param(nullptr, "source"); }, "missing airport");
    t.check_throws<ValidationError>([] { require_airport_param("   ", "dest"); }, "blank airport");
    t.check_throws<ValidationError>([] { require_airport_param("L1", "dest"); }, "malformed airport");

    t.check(parse_int_param(nullptr, "max_stops", 2, 0, 4) == 2, "integer default");
    t.check(parse_int_param("3", "max_stops", 2, 0, 4) == 3, "integer value");
    t.check_throws<ValidationError>([] { parse_int_param("5", "max_stops", 2, 0, 4); }, "integer above range");
    t.check_throws<ValidationError>([] { parse_int_param("two", "max_stops", 2, 0, 4); }, "integer not a number");
    t.check_throws<ValidationError>([] { parse_int_param("2.5", "max_stops", 2, 0, 4); }, "integer with fraction");

    t.check_near(parse_double_param("12.5", "radius_km", 500), 12.5, 1e-12, "double value");
    t.check_near(parse_double_param("", "radius_km", 500), 500, 1e-12, "double default");
    t.check_throws<ValidationError>([] { require_double_param(nullptr, "lat"); }, "missing double");
    t.check_throws<ValidationError>([] { parse_double_param("nan", "lat", 0); }, "non-finite double");
    t.check_throws<ValidationError>([] { parse_double_param("1e999", "lat", 0); }, "overflowing double");

    t.check(parse_bool_param("Yes", "enumerate", false), "bool true");
    t.check(!parse_bool_param("0", "enumerate", true), "bool false");
    t.check(parse_bool_param(nullptr, "enumerate", true), "bool default");
    t.check_throws<ValidationError>([] { parse_bool_param("maybe", "enumerate", false); }, "bad bool");

    TraceLimits limits;
    t.check(parse_max_states(nullptr, limits) == 300, "max_states default");
    t.check(parse_max_states("5000", limits) == 5000, "max_states at ceiling");
    t.check_throws<ValidationError>([&] { parse_max_states("5001", limits); }, "max_states above ceiling");
    t.check_throws<ValidationError>([&] { parse_max_states("0", limits); }, "max_states below 1");

    t.check(parse_weight_mode(nullptr) == WeightMode::PRICE, "weight mode default");
    t.check(parse_weight_mode("Fastest") == WeightMode::DURATION, "fastest alias");
    t.check(parse_weight_mode("distance") == WeightMode::DISTANCE, "distance alias");
    t.check_throws<ValidationError>([] { parse_weight_mode("scenic"); }, "bad weight mode");

    t.check(parse_strategy(nullptr) == DijkstraStrategy::HEAP, "strategy default");
    t.check(parse_strategy("ARRAY") == DijkstraStrategy::ARRAY, "array strategy");
    t.check_throws<ValidationError>([] { parse_strategy("fibonacci"); }, "bad strategy");

    t.check(parse_mst_algorithm("kruskal") == MSTAlgorithm::KRUSKAL, "kruskal");
    t.check(parse_mst_algorithm(nullptr) == MSTAlgorithm::PRIM, "mst default");
    t.check(parse_mst_scope("full") == MSTScope::FULL, "full scope");
    t.check(parse_mst_scope(nullptr) == MSTScope::ROUTE, "scope default");
    t.check_throws<ValidationError>([] { parse_mst_scope("region"); }, "bad scope");

    return t.report("query_params");
}
