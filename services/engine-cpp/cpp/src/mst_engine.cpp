/**
 * @file mst_engine.cpp
 * @brief Undirected price view, union-find, Prim and Kruskal.
 */

#include "mst_engine.hpp"
#include "engine_errors.hpp"
#include "graph_analyzer.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <numeric>
#include <queue>

namespace flight_routing {

const char* mst_algorithm_name(MSTAlgorithm algorithm) {
    return algorithm == MSTAlgorithm::PRIM ? "prim" : "kruskal";
}

const char* mst_scope_name(MSTScope scope) {
    return scope == MSTScope::ROUTE ? "route" : "full";
}

// ============================================================
// UNDIRECTED VIEW
// ============================================================

UndirectedPriceGraph UndirectedPriceGraph::from_flights(const FlightGraph& graph,
                                                        std::vector<std::string> airport_codes,
                                                        const std::vector<uint32_t>& edge_ids) {
    UndirectedPriceGraph view;

    std::sort(airport_codes.begin(), airport_codes.end());
    airport_codes.erase(std::unique(airport_codes.begin(), airport_codes.end()), airport_codes.end());
    view.vertices_ = std::move(airport_codes);

    std::unordered_map<std::string, uint32_t> index;
    for (uint32_t i = 0; i < view.vertices_.size(); ++i) index[view.vertices_[i]] = i;

    // Cheapest flight per unordered pair; equal prices keep the smaller edge id
    std::map<std::pair<uint32_t, uint32_t>, uint32_t> best;
    for (uint32_t e : edge_ids) {
        const FlightEdge& f = graph.edge(e);
        auto a = index.find(f.source);
        auto b = index.find(f.dest);
        if (a == index.end() || b == index.end() || a->second == b->second) continue;

        std::pair<uint32_t, uint32_t> key = std::minmax(a->second, b->second);
        auto it = best.find(key);
        if (it == best.end()) {
            best.emplace(key, e);
            continue;
        }
        const FlightEdge& cur = graph.edge(it->second);
        if (f.price < cur.price || (f.price == cur.price && e < it->second)) {
            it->second = e;
        }
    }

    std::vector<std::pair<std::pair<uint32_t, uint32_t>, uint32_t>> pairs(best.begin(), best.end());
    std::sort(pairs.begin(), pairs.end(), [&graph](const auto& x, const auto& y) {
        double wx = graph.edge(x.second).price;
        double wy = graph.edge(y.second).price;
        if (wx != wy) return wx < wy;
        return x.first < y.first;
    });

    view.incident_.assign(view.vertices_.size(), {});
    for (const auto& [ends, e] : pairs) {
        const FlightEdge& f = graph.edge(e);
        MSTEdge edge;
        edge.from = view.vertices_[ends.first];
        edge.to = view.vertices_[ends.second];
        edge.weight = f.price;
        edge.flight_edge = e;
        edge.flight_no = f.flight_no;

        size_t idx = view.edges_.size();
        view.edges_.push_back(std::move(edge));
        view.endpoints_.push_back(ends);
        view.incident_[ends.first].push_back(idx);
        view.incident_[ends.second].push_back(idx);
    }
    return view;
}

UndirectedPriceGraph UndirectedPriceGraph::full(const FlightGraph& graph) {
    std::vector<std::string> codes;
    codes.reserve(graph.vertex_count());
    for (const auto& a : graph.airports()) codes.push_back(a.code);

    std::vector<uint32_t> ids(graph.edge_count());
    std::iota(ids.begin(), ids.end(), 0u);
    return from_flights(graph, std::move(codes), ids);
}

std::optional<uint32_t> UndirectedPriceGraph::index_of(const std::string& code) const {
    auto it = std::lower_bound(vertices_.begin(), vertices_.end(), code);
    if (it == vertices_.end() || *it != code) return std::nullopt;
    return static_cast<uint32_t>(it - vertices_.begin());
}

UndirectedPriceGraph build_mst_view(const FlightGraph& graph,
                                    const std::string& source,
                                    const std::string& dest,
                                    MSTScope scope,
                                    int max_hops) {
    if (scope == MSTScope::FULL) {
        if (!source.empty()) graph.require_airport(source);
        if (!dest.empty()) graph.require_airport(dest);
        return UndirectedPriceGraph::full(graph);
    }

    RouteSubgraph sub = GraphAnalyzer(graph).route_subgraph(source, dest, max_hops);
    std::vector<uint32_t> ids;
    ids.reserve(sub.edges.size());
    for (const auto& e : sub.edges) ids.push_back(e.edge_id);
    return UndirectedPriceGraph::from_flights(graph, sub.airports, ids);
}

// ============================================================
// UNION-FIND
// ============================================================

UnionFind::UnionFind(size_t n) : parent_(n), rank_(n, 0) {
    std::iota(parent_.begin(), parent_.end(), 0u);
}

uint32_t UnionFind::find(uint32_t x) {
    uint32_t root = x;
    while (parent_[root] != root) root = parent_[root];
    while (parent_[x] != root) {
        uint32_t next = parent_[x];
        parent_[x] = root;
        x = next;
    }
    return root;
}

bool UnionFind::unite(uint32_t x, uint32_t y) {
    uint32_t rx = find(x);
    uint32_t ry = find(y);
    if (rx == ry) return false;

    if (rank_[rx] < rank_[ry]) std::swap(rx, ry);
    parent_[ry] = rx;
    if (rank_[rx] == rank_[ry]) rank_[rx]++;
    return true;
}

// ============================================================
// SOLVERS
// ============================================================

namespace {

struct MSTRun {
    const UndirectedPriceGraph& view;
    MSTObserver* observer;
    std::vector<char> visited;
    std::vector<MSTEdge> tree;
    double total = 0.0;

    MSTRun(const UndirectedPriceGraph& v, MSTObserver* obs)
        : view(v), observer(obs), visited(v.vertex_count(), 0) {}

    void notify(MSTEventKind kind, std::optional<std::string> node = std::nullopt,
                const MSTEdge* edge = nullptr) const {
        if (!observer) return;
        MSTEvent event;
        event.kind = kind;
        event.current_node = std::move(node);
        event.edge = edge;
        MSTView snapshot{view.vertices(), visited, tree, total};
        observer->on_mst_event(event, snapshot);
    }

    void add(size_t e) {
        tree.push_back(view.edges()[e]);
        total += view.edges()[e].weight;
    }
};

void run_prim(MSTRun& run, uint32_t start) {
    const auto& view = run.view;
    const size_t target = view.vertex_count() - 1;

    // Edge indices already follow (weight, from, to) order
    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> pq;

    auto grow = [&](uint32_t v) {
        run.visited[v] = 1;
        for (size_t e : view.incident(v)) {
            const auto& [a, b] = view.endpoints(e);
            if (!run.visited[a == v ? b : a]) pq.push(e);
        }
    };

    grow(start);
    run.notify(MSTEventKind::INITIAL, view.vertices()[start]);

    while (!pq.empty() && run.tree.size() < target) {
        size_t e = pq.top();
        pq.pop();

        const auto& [a, b] = view.endpoints(e);
        const MSTEdge& edge = view.edges()[e];
        if (run.visited[a] && run.visited[b]) {
            run.notify(MSTEventKind::SKIP_CYCLE, std::nullopt, &edge);
            continue;
        }

        uint32_t next = run.visited[a] ? b : a;
        run.add(e);
        grow(next);
        run.notify(MSTEventKind::ADD, view.vertices()[next], &edge);
    }
}

void run_kruskal(MSTRun& run) {
    const auto& view = run.view;
    const size_t target = view.vertex_count() - 1;
    UnionFind uf(view.vertex_count());

    run.notify(MSTEventKind::INITIAL);

    for (size_t e = 0; e < view.edge_count() && run.tree.size() < target; ++e) {
        const auto& [a, b] = view.endpoints(e);
        const MSTEdge& edge = view.edges()[e];

        if (!uf.unite(a, b)) {
            run.notify(MSTEventKind::SKIP_CYCLE, std::nullopt, &edge);
            continue;
        }
        run.visited[a] = 1;
        run.visited[b] = 1;
        run.add(e);
        run.notify(MSTEventKind::ADD, std::nullopt, &edge);
    }
}

}  // namespace

MSTResult MSTEngine::solve(const UndirectedPriceGraph& view,
                           MSTAlgorithm algorithm,
                           MSTObserver* observer,
                           const std::string& start_code) const {
    if (view.vertex_count() == 0) {
        throw ValidationError("MST scope contains no airports");
    }

    uint32_t start = 0;
    if (!start_code.empty()) {
        auto idx = view.index_of(start_code);
        if (!idx) {
            throw ValidationError("Start airport " + start_code + " is not part of the MST scope");
        }
        start = *idx;
    }

    MSTRun run(view, observer);
    if (algorithm == MSTAlgorithm::PRIM) {
        run_prim(run, start);
    } else {
        run_kruskal(run);
    }
    run.notify(MSTEventKind::FINAL);

    MSTResult result;
    result.algorithm = algorithm;
    result.edges = std::move(run.tree);
    result.total_weight = run.total;
    result.airports = view.vertices();
    result.connected = result.edges.size() == view.vertex_count() - 1;
    return result;
}

MSTSimulation MSTEngine::simulate(const UndirectedPriceGraph& view,
                                  MSTAlgorithm algorithm,
                                  size_t max_states,
                                  const std::string& start_code) const {
    StepRecorder recorder(max_states);
    MSTSimulation sim;
    sim.result = solve(view, algorithm, &recorder, start_code);
    sim.states = recorder.mst_states();
    sim.truncated = recorder.dropped() > 0;
    return sim;
}

}  // namespace flight_routing
