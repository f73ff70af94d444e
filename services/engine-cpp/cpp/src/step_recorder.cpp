/**
 * @file step_recorder.cpp
 * @brief Snapshot capture for Dijkstra and MST traces.
 */

#include "step_recorder.hpp"

#include <algorithm>
#include <cmath>

namespace flight_routing {

const char* search_event_name(SearchEventKind kind) {
    switch (kind) {
        case SearchEventKind::INITIAL: return "initial";
        case SearchEventKind::EXTRACT: return "extract";
        case SearchEventKind::SKIP_STALE: return "skip_stale";
        case SearchEventKind::RELAX: return "relax";
        case SearchEventKind::FINAL: return "final";
    }
    return "unknown";
}

const char* mst_event_name(MSTEventKind kind) {
    switch (kind) {
        case MSTEventKind::INITIAL: return "initial";
        case MSTEventKind::ADD: return "add";
        case MSTEventKind::SKIP_CYCLE: return "skip_cycle";
        case MSTEventKind::FINAL: return "final";
    }
    return "unknown";
}

StepRecorder::StepRecorder(size_t max_states)
    : max_states_(max_states), start_(std::chrono::steady_clock::now()) {}

double StepRecorder::elapsed_ms() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(now - start_).count();
}

void StepRecorder::on_search_event(const SearchEvent& event, const SearchView& view) {
    if (event.kind == SearchEventKind::INITIAL) {
        start_ = std::chrono::steady_clock::now();
    }
    if (search_states_.size() >= max_states_) {
        dropped_++;
        return;
    }

    const FlightGraph& g = view.graph;

    SearchState s;
    s.step = search_states_.size();
    s.time_ms = elapsed_ms();
    s.event = event.kind;
    if (event.current) s.current = g.airport(*event.current).code;

    for (uint32_t v = 0; v < view.visited.size(); ++v) {
        if (view.visited[v]) s.visited.push_back(g.airport(v).code);
    }

    auto frontier = view.frontier ? view.frontier() : std::vector<std::pair<uint32_t, double>>{};
    std::sort(frontier.begin(), frontier.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second < b.second;
        return a.first < b.first;
    });
    for (const auto& [v, cost] : frontier) {
        s.frontier.push_back({g.airport(v).code, cost});
    }

    for (uint32_t v = 0; v < view.dist.size(); ++v) {
        if (std::isfinite(view.dist[v])) s.distances[g.airport(v).code] = view.dist[v];
        if (view.parent_edge[v] >= 0) {
            s.came_from[g.airport(v).code] = g.edge(static_cast<uint32_t>(view.parent_edge[v])).source;
        }
    }

    if (event.kind == SearchEventKind::RELAX && event.edge) {
        RelaxRecord r;
        r.from = event.edge->source;
        r.to = event.edge->dest;
        r.flight_no = event.edge->flight_no;
        r.updated = event.improved;
        if (event.improved) r.new_cost = event.new_cost;
        s.relax = std::move(r);
    }

    search_states_.push_back(std::move(s));
}

void StepRecorder::on_mst_event(const MSTEvent& event, const MSTView& view) {
    if (mst_states_.size() >= max_states_) {
        dropped_++;
        return;
    }

    MSTState s;
    s.step = mst_states_.size();
    s.event = event.kind;
    s.current_node = event.current_node;
    for (size_t i = 0; i < view.visited.size(); ++i) {
        if (view.visited[i]) s.visited.push_back(view.vertex_codes[i]);
    }
    s.mst_edges = view.tree;
    if (event.edge) s.current_edge = *event.edge;
    s.total_weight = view.total_weight;

    mst_states_.push_back(std::move(s));
}

}  // namespace flight_routing
