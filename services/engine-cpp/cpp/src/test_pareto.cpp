/**
 * @file test_pareto.cpp
 * @brief Dominance relation and Pareto route sets.
 */

#include "engine_errors.hpp"
#include "pareto_finder.hpp"
#include "test_support.hpp"

using namespace flight_routing;
using test_support::TestResult;

static Route metrics(double price, int duration, double distance) {
    Route r;
    r.total_price = price;
    r.total_duration_min = duration;
    r.total_distance_km = distance;
    return r;
}

static bool is_antichain(const std::vector<Route>& routes) {
    for (const auto& a : routes) {
        for (const auto& b : routes) {
            if (&a != &b && dominates(a, b)) return false;
        }
    }
    return true;
}

static void test_dominance(TestResult& t) {
    t.check(dominates(metrics(100, 60, 500), metrics(200, 60, 500)), "cheaper and otherwise equal dominates");
    t.check(!dominates(metrics(100, 60, 500), metrics(100, 60, 500)), "equal routes do not dominate");
    t.check(!dominates(metrics(100, 90, 500), metrics(200, 60, 500)), "trade-off does not dominate");
    t.check(!dominates(metrics(200, 60, 500), metrics(100, 60, 500)), "dominance is asymmetric");
}

static void test_seed_pareto(TestResult& t, const FlightGraph& g) {
    ParetoRouteFinder finder;
    auto result = finder.find(g, "LHE", "JFK");

    t.check(result.total_candidates == 3, "three distinct optima");
    t.check(result.pareto_count == 3, "all optima non-dominated");
    t.check(result.pareto_routes.size() == result.pareto_count, "count matches routes");
    t.check(is_antichain(result.pareto_routes), "pareto set is an antichain");
    t.check(result.all_candidates[0].origin == "cheapest" && result.all_candidates[1].origin == "fastest" &&
                result.all_candidates[2].origin == "shortest",
            "candidates in optimum order");
    t.check(test_support::join(result.pareto_routes[0].path) == "LHE-DXB-DOH-JFK", "cheapest route kept");

    ParetoOptions options;
    options.enumerate_stops = true;
    options.max_stops = 2;
    auto enumerated = ParetoRouteFinder(options).find(g, "LHE", "JFK");
    t.check(enumerated.total_candidates == 4, "enumeration adds LHE-IST-JFK");
    t.check(enumerated.pareto_count == 4, "LHE-IST-JFK trades price for distance");
    t.check(enumerated.all_candidates.back().origin == "enumerated", "enumerated origin");
    t.check(is_antichain(enumerated.pareto_routes), "enumerated set is an antichain");

    auto none = finder.find(g, "MID", "JFK");
    t.check(none.total_candidates == 0 && none.pareto_routes.empty(), "no route gives empty set");

    t.check_throws<ValidationError>([&] { finder.find(g, "LHE", "LHE"); }, "same endpoints");
    t.check_throws<UnknownAirport>([&] { finder.find(g, "LHE", "ORD"); }, "unknown airport");

    ParetoOptions too_many;
    too_many.max_stops = 5;
    t.check_throws<ValidationError>([&] { ParetoRouteFinder bad(too_many); }, "max_stops above range");
}

static void test_dominated_candidate(TestResult& t) {
    // Direct AAA-BBB beats the detour on every metric
    std::vector<Airport> airports = {
        test_support::airport("AAA", 0, 0),
        test_support::airport("BBB", 0, 10),
        test_support::airport("CCC", 5, 5),
    };
    std::vector<FlightEdge> flights = {
        test_support::flight("XX1", "AAA", "BBB", 60, 100),
        test_support::flight("XX2", "AAA", "CCC", 60, 100),
        test_support::flight("XX3", "CCC", "BBB", 60, 100),
    };
    FlightGraph g = FlightGraph::build(airports, flights);

    auto optima = ParetoRouteFinder().find(g, "AAA", "BBB");
    t.check(optima.total_candidates == 1, "identical optima collapse to one candidate");

    ParetoOptions options;
    options.enumerate_stops = true;
    auto result = ParetoRouteFinder(options).find(g, "AAA", "BBB");
    t.check(result.total_candidates == 2, "detour enumerated");
    t.check(result.pareto_count == 1, "detour dominated");
    t.check(!result.all_candidates[1].pareto_optimal, "detour flagged non-optimal");
}

int main() {
    TestResult t;
    FlightGraph g = test_support::seed_graph();

    test_dominance(t);
    test_seed_pareto(t, g);
    test_dominated_candidate(t);

    return t.report("pareto");
}
