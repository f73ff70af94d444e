/**
 * @file test_mst.cpp
 * @brief Prim, Kruskal and the undirected price view.
 */

#include "engine_errors.hpp"
#include "mst_engine.hpp"
#include "test_support.hpp"

using namespace flight_routing;
using test_support::TestResult;

static bool is_spanning_forest(const MSTResult& r, size_t vertices) {
    UnionFind uf(vertices);
    std::map<std::string, uint32_t> index;
    for (uint32_t i = 0; i < r.airports.size(); ++i) index[r.airports[i]] = i;
    for (const auto& e : r.edges) {
        if (!uf.unite(index.at(e.from), index.at(e.to))) return false;
    }
    return true;
}

static void test_undirected_view(TestResult& t, const FlightGraph& g) {
    std::vector<Airport> airports = {
        test_support::airport("AAA", 0, 0),
        test_support::airport("BBB", 0, 1),
    };
    std::vector<FlightEdge> flights = {
        test_support::flight("XX1", "AAA", "BBB", 60, 300),
        test_support::flight("XX2", "BBB", "AAA", 60, 120),
        test_support::flight("XX3", "AAA", "BBB", 60, 120),
    };
    FlightGraph pair = FlightGraph::build(airports, flights);
    auto view = UndirectedPriceGraph::full(pair);
    t.check(view.edge_count() == 1, "parallel and reverse flights collapse to one edge");
    t.check_near(view.edges()[0].weight, 120, 1e-9, "edge keeps the minimum price");
    t.check(view.edges()[0].flight_no == "XX2", "equal prices keep the earlier flight");
    t.check(view.edges()[0].from == "AAA" && view.edges()[0].to == "BBB", "endpoints ordered by code");

    auto full = UndirectedPriceGraph::full(g);
    t.check(full.vertex_count() == 7 && full.edge_count() == 7, "full seed view size");
    bool sorted = true;
    for (size_t i = 1; i < full.edge_count(); ++i) {
        if (full.edges()[i - 1].weight > full.edges()[i].weight) sorted = false;
    }
    t.check(sorted, "edges sorted by weight");
    t.check(full.index_of("JFK").has_value() && !full.index_of("XYZ").has_value(), "index_of lookup");
}

static void test_union_find(TestResult& t) {
    UnionFind uf(4);
    t.check(uf.unite(0, 1), "unite disjoint sets");
    t.check(uf.unite(2, 3), "unite second pair");
    t.check(!uf.unite(1, 0), "already united");
    t.check(uf.unite(1, 3), "merge pairs");
    t.check(uf.find(0) == uf.find(2), "single set after merges");
}

static void test_full_scope(TestResult& t, const FlightGraph& g) {
    MSTEngine engine;
    auto view = build_mst_view(g, "", "", MSTScope::FULL);

    auto prim = engine.solve(view, MSTAlgorithm::PRIM, nullptr, "LHE");
    auto kruskal = engine.solve(view, MSTAlgorithm::KRUSKAL);

    t.check_near(kruskal.total_weight, 1000, 1e-9, "kruskal forest weight");
    t.check(kruskal.edges.size() == 4, "kruskal forest edges");
    t.check(!kruskal.connected, "FRA and MID are isolated");
    t.check_near(prim.total_weight, 1000, 1e-9, "prim spans the start component");
    t.check(!prim.connected, "prim tree does not reach isolated airports");
    t.check(is_spanning_forest(kruskal, view.vertex_count()), "kruskal edges are acyclic");
    t.check(is_spanning_forest(prim, view.vertex_count()), "prim edges are acyclic");

    auto from_mid = engine.solve(view, MSTAlgorithm::PRIM, nullptr, "MID");
    t.check(from_mid.edges.empty() && from_mid.total_weight == 0.0, "prim from isolated airport");

    t.check_throws<ValidationError>([&] { engine.solve(view, MSTAlgorithm::PRIM, nullptr, "ORD"); },
                                    "start outside scope");
    t.check_throws<UnknownAirport>([&] { build_mst_view(g, "XXX", "", MSTScope::FULL); },
                                   "full scope still validates codes");
}

static void test_route_scope(TestResult& t, const FlightGraph& g) {
    MSTEngine engine;
    auto view = build_mst_view(g, "LHE", "JFK", MSTScope::ROUTE, 3);
    t.check(view.vertices() == std::vector<std::string>({"DOH", "DXB", "IST", "JFK", "LHE"}),
            "route scope airports");

    auto prim = engine.solve(view, MSTAlgorithm::PRIM, nullptr, "LHE");
    auto kruskal = engine.solve(view, MSTAlgorithm::KRUSKAL);
    t.check(prim.connected && kruskal.connected, "route scope is connected");
    t.check(prim.edges.size() == view.vertex_count() - 1, "tree has V-1 edges");
    t.check_near(prim.total_weight, kruskal.total_weight, 1e-9, "prim and kruskal agree on weight");
    t.check(prim.edges.front().flight_no == "PK201", "prim first takes the cheapest edge at LHE");
    t.check(kruskal.edges.front().flight_no == "EK301", "kruskal first takes the globally cheapest edge");

    auto direct = build_mst_view(g, "LHE", "JFK", MSTScope::ROUTE, 1);
    auto one = engine.solve(direct, MSTAlgorithm::KRUSKAL);
    t.check(one.edges.size() == 1 && one.edges[0].flight_no == "PK999", "one hop keeps the direct flight");

    t.check_throws<ValidationError>([&] { build_mst_view(g, "LHE", "JFK", MSTScope::ROUTE, 0); },
                                    "max_hops below range");
    t.check_throws<ValidationError>([&] { build_mst_view(g, "LHE", "LHE", MSTScope::ROUTE); },
                                    "route scope needs distinct airports");
}

static void test_simulation(TestResult& t, const FlightGraph& g) {
    MSTEngine engine;
    auto view = build_mst_view(g, "LHE", "JFK", MSTScope::ROUTE);

    auto sim = engine.simulate(view, MSTAlgorithm::KRUSKAL, 1000);
    t.check(sim.states.front().event == MSTEventKind::INITIAL, "mst trace starts with initial");
    t.check(sim.states.back().event == MSTEventKind::FINAL, "mst trace ends with final");
    t.check(sim.states.back().mst_edges.size() == sim.result.edges.size(), "final state holds the tree");

    // Full view: Kruskal keeps scanning past LHE-DOH since FRA and MID stay apart
    auto forest = engine.simulate(build_mst_view(g, "", "", MSTScope::FULL), MSTAlgorithm::KRUSKAL, 1000);
    bool skipped = false;
    for (const auto& s : forest.states) {
        if (s.event == MSTEventKind::SKIP_CYCLE) skipped = true;
    }
    t.check(skipped, "cycle-forming edge recorded as skipped");

    auto capped = engine.simulate(view, MSTAlgorithm::PRIM, 2, "LHE");
    t.check(capped.states.size() == 2 && capped.truncated, "mst trace capped");
    t.check(!sim.truncated, "full mst trace not truncated");

    auto exact = engine.simulate(view, MSTAlgorithm::KRUSKAL, sim.states.size());
    t.check(exact.states.size() == sim.states.size() && !exact.truncated, "mst trace that fits the cap is complete");
    t.check_near(capped.result.total_weight, 1000, 1e-9, "cap does not change the tree");
}

int main() {
    TestResult t;
    FlightGraph g = test_support::seed_graph();

    test_undirected_view(t, g);
    test_union_find(t);
    test_full_scope(t, g);
    test_route_scope(t, g);
    test_simulation(t, g);

    return t.report("mst");
}
