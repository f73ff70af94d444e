/**
 * @file graph_analyzer.cpp
 * @brief Stats, adjacency views, BFS connectivity and route subgraph DFS.
 */

#include "graph_analyzer.hpp"
#include "engine_errors.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <limits>
#include <set>
#include <unordered_set>

namespace flight_routing {

constexpr int MAX_ROUTE_HOPS = 6;

static double directed_density(size_t vertices, size_t edges) {
    if (vertices < 2) return 0.0;
    return static_cast<double>(edges) / (static_cast<double>(vertices) * (vertices - 1));
}

// ============================================================
// STATS / ADJACENCY
// ============================================================

GraphStats GraphAnalyzer::stats() const {
    GraphStats s;
    s.vertices = graph_.vertex_count();
    s.edges = graph_.edge_count();
    s.density = directed_density(s.vertices, s.edges);

    if (s.vertices == 0) return s;

    s.min_degree = std::numeric_limits<size_t>::max();
    size_t total = 0;
    for (uint32_t v = 0; v < s.vertices; ++v) {
        size_t d = graph_.out_degree(v);
        total += d;
        s.min_degree = std::min(s.min_degree, d);
        s.max_degree = std::max(s.max_degree, d);
    }
    s.avg_degree = static_cast<double>(total) / s.vertices;
    return s;
}

AdjacencyList GraphAnalyzer::adjacency_list() const {
    AdjacencyList list;

    // Airports that appear in any flight get an entry, even with no outgoing flights
    for (const auto& e : graph_.edges()) {
        list[e.source];
        list[e.dest];
    }

    for (uint32_t v = 0; v < graph_.vertex_count(); ++v) {
        std::vector<uint32_t> out = graph_.out_edges(v);
        if (out.empty()) continue;

        std::stable_sort(out.begin(), out.end(), [this](uint32_t a, uint32_t b) {
            const FlightEdge& ea = graph_.edge(a);
            const FlightEdge& eb = graph_.edge(b);
            if (ea.dest != eb.dest) return ea.dest < eb.dest;
            return ea.flight_no < eb.flight_no;
        });

        auto& entries = list[graph_.airport(v).code];
        for (uint32_t e : out) {
            const FlightEdge& f = graph_.edge(e);
            entries.push_back({f.dest, f.flight_no, f.price, f.duration_min});
        }
    }
    return list;
}

AdjacencyMatrix GraphAnalyzer::adjacency_matrix() const {
    AdjacencyMatrix m;
    const size_t n = graph_.vertex_count();

    m.airports.reserve(n);
    for (const auto& a : graph_.airports()) m.airports.push_back(a.code);
    m.matrix.assign(n, std::vector<double>(n, 0.0));

    // Only the cheapest flight per ordered pair is kept
    std::vector<std::vector<char>> seen(n, std::vector<char>(n, 0));
    for (const auto& e : graph_.edges()) {
        if (!seen[e.from][e.to] || e.price < m.matrix[e.from][e.to]) {
            m.matrix[e.from][e.to] = e.price;
            seen[e.from][e.to] = 1;
        }
    }
    return m;
}

// ============================================================
// CONNECTIVITY
// ============================================================

ComponentsResult GraphAnalyzer::connected_components() const {
    ComponentsResult result;
    const size_t n = graph_.vertex_count();
    std::vector<char> seen(n, 0);

    for (uint32_t start = 0; start < n; ++start) {
        if (seen[start]) continue;

        std::vector<std::string> component;
        std::deque<uint32_t> queue{start};
        seen[start] = 1;

        while (!queue.empty()) {
            uint32_t u = queue.front();
            queue.pop_front();
            component.push_back(graph_.airport(u).code);

            auto visit = [&](uint32_t w) {
                if (!seen[w]) {
                    seen[w] = 1;
                    queue.push_back(w);
                }
            };
            for (uint32_t e : graph_.out_edges(u)) visit(graph_.edge(e).to);
            for (uint32_t e : graph_.in_edges(u)) visit(graph_.edge(e).from);
        }

        std::sort(component.begin(), component.end());
        result.components.push_back(std::move(component));
    }

    std::stable_sort(result.components.begin(), result.components.end(),
                     [](const auto& a, const auto& b) {
                         if (a.size() != b.size()) return a.size() > b.size();
                         return a.front() < b.front();
                     });

    result.largest = result.components.empty() ? 0 : result.components.front().size();
    result.fully_connected = result.components.size() == 1;
    return result;
}

Connectivity GraphAnalyzer::connectivity(const std::string& source, const std::string& dest) const {
    uint32_t s = graph_.require_airport(source);
    uint32_t t = graph_.require_airport(dest);

    Connectivity c;
    c.source = source;
    c.dest = dest;

    std::vector<int> hops(graph_.vertex_count(), -1);
    std::deque<uint32_t> queue{s};
    hops[s] = 0;

    while (!queue.empty()) {
        uint32_t u = queue.front();
        queue.pop_front();
        c.visit_order.push_back(graph_.airport(u).code);

        for (uint32_t e : graph_.out_edges(u)) {
            uint32_t w = graph_.edge(e).to;
            if (hops[w] < 0) {
                hops[w] = hops[u] + 1;
                queue.push_back(w);
            }
        }
    }

    c.reachable = hops[t] >= 0;
    c.hops = hops[t];
    return c;
}

bool GraphAnalyzer::is_reachable(const std::string& source, const std::string& dest) const {
    return connectivity(source, dest).reachable;
}

// ============================================================
// ROUTE SUBGRAPH
// ============================================================

RouteSubgraph GraphAnalyzer::route_subgraph(const std::string& source, const std::string& dest, int max_hops) const {
    if (max_hops < 1 || max_hops > MAX_ROUTE_HOPS) {
        throw ValidationError("max_hops must be between 1 and " + std::to_string(MAX_ROUTE_HOPS));
    }
    uint32_t s = graph_.require_airport(source);
    uint32_t t = graph_.require_airport(dest);
    if (s == t) {
        throw ValidationError("Source and destination must differ");
    }

    RouteSubgraph sub;
    sub.source = source;
    sub.dest = dest;
    sub.max_hops = max_hops;

    std::set<std::string> airports{source, dest};
    std::unordered_set<uint32_t> edge_seen;
    std::vector<char> on_path(graph_.vertex_count(), 0);
    std::vector<uint32_t> path_edges;

    // DFS over simple paths; each flight combination counts as its own path
    std::function<void(uint32_t, int)> dfs = [&](uint32_t u, int hops_left) {
        if (u == t && !path_edges.empty()) {
            for (uint32_t e : path_edges) {
                const FlightEdge& f = graph_.edge(e);
                airports.insert(f.source);
                airports.insert(f.dest);
                if (edge_seen.insert(e).second) {
                    sub.edges.push_back({e, f.source, f.dest, f.flight_no, f.price});
                }
            }
            switch (path_edges.size()) {
                case 1: sub.direct_flights++; break;
                case 2: sub.one_stop_options++; break;
                case 3: sub.two_stop_options++; break;
                default: break;
            }
            sub.total_paths++;
            return;
        }
        if (hops_left <= 0) return;

        for (uint32_t e : graph_.out_edges(u)) {
            uint32_t w = graph_.edge(e).to;
            if (on_path[w]) continue;
            on_path[w] = 1;
            path_edges.push_back(e);
            dfs(w, hops_left - 1);
            path_edges.pop_back();
            on_path[w] = 0;
        }
    };

    on_path[s] = 1;
    dfs(s, max_hops);

    sub.airports.assign(airports.begin(), airports.end());
    sub.source_degree = graph_.out_degree(s);
    sub.dest_degree = graph_.in_degree(t);
    sub.subgraph_density = directed_density(sub.airports.size(), sub.edges.size());
    sub.is_connected = is_reachable(source, dest);
    return sub;
}

}  // namespace flight_routing
