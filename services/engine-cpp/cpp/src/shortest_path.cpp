/**
 * @file shortest_path.cpp
 * @brief Dijkstra strategies, route building and path reconstruction.
 */

#include "shortest_path.hpp"
#include "engine_errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <queue>
#include <set>

namespace flight_routing {

const char* strategy_name(DijkstraStrategy strategy) {
    return strategy == DijkstraStrategy::ARRAY ? "array" : "heap";
}

// ============================================================
// PRIORITY QUEUE ENTRIES
// ============================================================

// Ordered by (cost, vertex); vertex order is airport code order
struct PQEntry {
    double dist;
    uint32_t vertex;
    bool operator>(const PQEntry& o) const {
        if (dist != o.dist) return dist > o.dist;
        return vertex > o.vertex;
    }
};

using MinHeap = std::priority_queue<PQEntry, std::vector<PQEntry>, std::greater<PQEntry>>;

// ============================================================
// SEARCH STATE
// ============================================================

namespace {

struct SearchRun {
    const FlightGraph& graph;
    SearchObserver* observer;
    std::vector<double> dist;
    std::vector<char> visited;
    std::vector<int64_t> parent_edge;
    OperationCounters ops;

    SearchRun(const FlightGraph& g, SearchObserver* obs)
        : graph(g),
          observer(obs),
          dist(g.vertex_count(), std::numeric_limits<double>::infinity()),
          visited(g.vertex_count(), 0),
          parent_edge(g.vertex_count(), -1) {}

    template <typename FrontierFn>
    void notify(const SearchEvent& event, FrontierFn&& frontier) const {
        if (!observer) return;
        SearchView view{graph, dist, visited, parent_edge, frontier};
        observer->on_search_event(event, view);
    }
};

SearchEvent make_event(SearchEventKind kind, std::optional<uint32_t> current = std::nullopt) {
    SearchEvent e;
    e.kind = kind;
    e.current = current;
    return e;
}

std::vector<std::pair<uint32_t, double>> heap_contents(MinHeap heap) {
    std::vector<std::pair<uint32_t, double>> out;
    out.reserve(heap.size());
    while (!heap.empty()) {
        out.push_back({heap.top().vertex, heap.top().dist});
        heap.pop();
    }
    return out;
}

void run_array(SearchRun& run, const WeightedAdjacency& adj, uint32_t source, uint32_t dest) {
    const size_t n = run.graph.vertex_count();
    constexpr double INF = std::numeric_limits<double>::infinity();

    // Frontier: unvisited vertices with a finite tentative distance
    auto frontier = [&run, n]() {
        std::vector<std::pair<uint32_t, double>> out;
        for (uint32_t v = 0; v < n; ++v) {
            if (!run.visited[v] && std::isfinite(run.dist[v])) out.push_back({v, run.dist[v]});
        }
        return out;
    };

    run.dist[source] = 0.0;
    run.notify(make_event(SearchEventKind::INITIAL), frontier);

    while (true) {
        // Linear scan; strict < keeps the smallest code among equal costs
        int64_t best = -1;
        double best_dist = INF;
        for (uint32_t v = 0; v < n; ++v) {
            if (run.visited[v]) continue;
            run.ops.comparisons++;
            if (run.dist[v] < best_dist) {
                best_dist = run.dist[v];
                best = v;
            }
        }
        run.ops.extract_min_ops++;

        if (best < 0) break;

        uint32_t u = static_cast<uint32_t>(best);
        run.visited[u] = 1;
        run.notify(make_event(SearchEventKind::EXTRACT, u), frontier);

        if (u == dest) break;

        for (const auto& arc : adj.arcs(u)) {
            if (run.visited[arc.to]) continue;

            double nd = run.dist[u] + arc.weight;
            run.ops.relax_ops++;
            run.ops.comparisons++;

            bool improved = nd < run.dist[arc.to];
            if (improved) {
                run.dist[arc.to] = nd;
                run.parent_edge[arc.to] = arc.edge;
            }

            SearchEvent e = make_event(SearchEventKind::RELAX, u);
            e.edge = &run.graph.edge(arc.edge);
            e.improved = improved;
            e.new_cost = nd;
            run.notify(e, frontier);
        }
    }

    run.notify(make_event(SearchEventKind::FINAL), frontier);
}

void run_heap(SearchRun& run, const WeightedAdjacency& adj, uint32_t source, uint32_t dest) {
    MinHeap pq;

    auto frontier = [&pq]() { return heap_contents(pq); };

    run.dist[source] = 0.0;
    pq.push({0.0, source});
    run.ops.heap_operations++;
    run.notify(make_event(SearchEventKind::INITIAL), frontier);

    while (!pq.empty()) {
        auto [d, u] = pq.top();
        pq.pop();
        run.ops.heap_operations++;
        run.ops.extract_min_ops++;

        run.ops.comparisons++;
        if (run.visited[u] || d > run.dist[u]) {
            run.notify(make_event(SearchEventKind::SKIP_STALE, u), frontier);
            continue;
        }

        run.visited[u] = 1;
        run.notify(make_event(SearchEventKind::EXTRACT, u), frontier);

        if (u == dest) break;

        for (const auto& arc : adj.arcs(u)) {
            if (run.visited[arc.to]) continue;

            double nd = d + arc.weight;
            run.ops.relax_ops++;
            run.ops.comparisons++;

            bool improved = nd < run.dist[arc.to];
            if (improved) {
                run.dist[arc.to] = nd;
                run.parent_edge[arc.to] = arc.edge;
                pq.push({nd, arc.to});
                run.ops.heap_operations++;
            }

            SearchEvent e = make_event(SearchEventKind::RELAX, u);
            e.edge = &run.graph.edge(arc.edge);
            e.improved = improved;
            e.new_cost = nd;
            run.notify(e, frontier);
        }
    }

    run.notify(make_event(SearchEventKind::FINAL), frontier);
}

}  // namespace

// ============================================================
// ROUTES
// ============================================================

Route build_route(const FlightGraph& graph, const std::vector<uint32_t>& leg_edges) {
    if (leg_edges.empty()) {
        throw InvariantViolation("Route must have at least one leg");
    }

    Route route;
    for (size_t i = 0; i < leg_edges.size(); ++i) {
        const FlightEdge& leg = graph.edge(leg_edges[i]);
        if (i == 0) {
            route.path.push_back(leg.source);
        } else if (route.path.back() != leg.source) {
            throw InvariantViolation("Route legs do not chain at " + leg.source);
        }
        route.path.push_back(leg.dest);

        route.total_price += leg.price;
        route.total_duration_min += leg.duration_min;
        route.total_distance_km += graph.edge_distance_km(leg);
        route.legs.push_back(leg);
    }

    for (const auto& code : route.path) {
        const Airport& a = graph.airport(graph.require_airport(code));
        route.coords.push_back({a.latitude, a.longitude});
    }

    route.stops = static_cast<int>(route.path.size()) - 2;
    return route;
}

std::vector<std::string> reconstruct_path(const std::map<std::string, std::string>& came_from,
                                          const std::string& source,
                                          const std::string& dest) {
    std::vector<std::string> path;
    if (came_from.find(dest) == came_from.end()) return path;

    std::set<std::string> seen;
    std::string curr = dest;
    while (curr != source) {
        if (!seen.insert(curr).second) {
            throw InvariantViolation("came_from contains a cycle at " + curr);
        }
        path.push_back(curr);
        auto it = came_from.find(curr);
        if (it == came_from.end()) {
            throw InvariantViolation("came_from chain breaks at " + curr);
        }
        curr = it->second;
    }
    path.push_back(source);
    std::reverse(path.begin(), path.end());
    return path;
}

// ============================================================
// ENGINE
// ============================================================

ShortestPathResult ShortestPathEngine::solve(const FlightGraph& graph,
                                             const std::string& source,
                                             const std::string& dest,
                                             WeightMode mode,
                                             SearchObserver* observer) const {
    return solve(graph, source, dest, graph.weight_fn(mode), observer);
}

ShortestPathResult ShortestPathEngine::solve(const FlightGraph& graph,
                                             const std::string& source,
                                             const std::string& dest,
                                             const WeightFn& weight,
                                             SearchObserver* observer) const {
    uint32_t s = graph.require_airport(source);
    uint32_t t = graph.require_airport(dest);
    if (s == t) {
        throw ValidationError("Source and destination must differ");
    }

    WeightedAdjacency adjacency(graph, weight);
    return solve(graph, adjacency, s, t, observer);
}

ShortestPathResult ShortestPathEngine::solve(const FlightGraph& graph,
                                             const WeightedAdjacency& adjacency,
                                             uint32_t source,
                                             uint32_t dest,
                                             SearchObserver* observer) const {
    auto start_time = std::chrono::steady_clock::now();

    SearchRun run(graph, observer);
    if (strategy_ == DijkstraStrategy::ARRAY) {
        run_array(run, adjacency, source, dest);
    } else {
        run_heap(run, adjacency, source, dest);
    }

    auto end_time = std::chrono::steady_clock::now();

    ShortestPathResult result;
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    result.ops = run.ops;
    result.vertices = graph.vertex_count();
    result.edges = graph.edge_count();

    for (uint32_t v = 0; v < graph.vertex_count(); ++v) {
        if (std::isfinite(run.dist[v])) result.distances[graph.airport(v).code] = run.dist[v];
        if (run.parent_edge[v] >= 0) {
            result.came_from[graph.airport(v).code] =
                graph.edge(static_cast<uint32_t>(run.parent_edge[v])).source;
        }
    }

    if (!run.visited[dest]) {
        result.found = false;
        result.error = "No route found";
        return result;
    }

    // Collect legs back from dest through parent edges
    std::vector<uint32_t> legs;
    uint32_t curr = dest;
    while (curr != source) {
        if (run.parent_edge[curr] < 0 || legs.size() > graph.vertex_count()) {
            throw InvariantViolation("Broken parent chain at " + graph.airport(curr).code);
        }
        uint32_t e = static_cast<uint32_t>(run.parent_edge[curr]);
        legs.push_back(e);
        curr = graph.edge(e).from;
    }
    std::reverse(legs.begin(), legs.end());

    result.found = true;
    result.cost = run.dist[dest];
    result.route = build_route(graph, legs);
    result.route.stats.nodes_explored =
        static_cast<size_t>(std::count(run.visited.begin(), run.visited.end(), 1));
    result.route.stats.edges_checked = run.ops.relax_ops;
    result.route.stats.time_ms = result.execution_time_ms;
    return result;
}

SimulationResult ShortestPathEngine::simulate(const FlightGraph& graph,
                                              const std::string& source,
                                              const std::string& dest,
                                              WeightMode mode,
                                              size_t max_states) const {
    StepRecorder recorder(max_states);
    SimulationResult sim;
    sim.result = solve(graph, source, dest, mode, &recorder);
    sim.states = recorder.search_states();
    sim.truncated = recorder.dropped() > 0;
    return sim;
}

}  // namespace flight_routing
