/**
 * @file step_recorder.hpp
 * @brief Observer hooks for the solvers and the snapshot recorder behind the
 * step-by-step visualizations.
 *
 * Solvers only call the observer interfaces; they never build snapshots
 * themselves. StepRecorder turns the events into SearchState / MSTState
 * snapshots and stops recording once max_states is reached, without
 * affecting the solver run.
 */

#pragma once

#include "flight_graph.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace flight_routing {

// ============================================================
// SHORTEST PATH EVENTS
// ============================================================

enum class SearchEventKind {
    INITIAL,     ///< Source seeded, nothing extracted yet
    EXTRACT,     ///< Vertex finalized
    SKIP_STALE,  ///< Outdated heap entry popped and ignored
    RELAX,       ///< Arc considered from the current vertex
    FINAL        ///< Search finished (found or exhausted)
};

const char* search_event_name(SearchEventKind kind);

struct SearchEvent {
    SearchEventKind kind = SearchEventKind::INITIAL;
    std::optional<uint32_t> current;
    const FlightEdge* edge = nullptr;  ///< RELAX only
    bool improved = false;             ///< RELAX only
    double new_cost = 0.0;             ///< Candidate cost (RELAX only)
};

/**
 * @brief Read-only view of solver state at the time of an event.
 */
struct SearchView {
    const FlightGraph& graph;
    const std::vector<double>& dist;          ///< +inf when not reached
    const std::vector<char>& visited;
    const std::vector<int64_t>& parent_edge;  ///< Edge id that reached v, -1 if none
    /// Frontier contents as (vertex, cost); only evaluated when a snapshot is taken
    std::function<std::vector<std::pair<uint32_t, double>>()> frontier;
};

class SearchObserver {
public:
    virtual ~SearchObserver() = default;
    virtual void on_search_event(const SearchEvent& event, const SearchView& view) = 0;
};

// ============================================================
// MST EVENTS
// ============================================================

/**
 * @brief Undirected MST edge, endpoints stored with from < to.
 */
struct MSTEdge {
    std::string from;
    std::string to;
    double weight = 0.0;
    uint32_t flight_edge = 0;  ///< Cheapest flight backing this edge
    std::string flight_no;
};

enum class MSTEventKind {
    INITIAL,
    ADD,         ///< Edge accepted into the tree
    SKIP_CYCLE,  ///< Edge rejected, endpoints already connected
    FINAL
};

const char* mst_event_name(MSTEventKind kind);

struct MSTEvent {
    MSTEventKind kind = MSTEventKind::INITIAL;
    std::optional<std::string> current_node;
    const MSTEdge* edge = nullptr;  ///< Edge under consideration
};

struct MSTView {
    const std::vector<std::string>& vertex_codes;
    const std::vector<char>& visited;
    const std::vector<MSTEdge>& tree;
    double total_weight;
};

class MSTObserver {
public:
    virtual ~MSTObserver() = default;
    virtual void on_mst_event(const MSTEvent& event, const MSTView& view) = 0;
};

// ============================================================
// SNAPSHOTS
// ============================================================

struct RelaxRecord {
    std::string from;
    std::string to;
    std::string flight_no;
    bool updated = false;
    std::optional<double> new_cost;  ///< Set only when updated
};

struct SearchState {
    size_t step = 0;
    double time_ms = 0.0;
    SearchEventKind event = SearchEventKind::INITIAL;
    std::optional<std::string> current;
    std::vector<std::string> visited;
    std::vector<std::pair<std::string, double>> frontier;  ///< Sorted by (cost, code)
    std::map<std::string, double> distances;
    std::map<std::string, std::string> came_from;
    std::optional<RelaxRecord> relax;
};

struct MSTState {
    size_t step = 0;
    MSTEventKind event = MSTEventKind::INITIAL;
    std::optional<std::string> current_node;
    std::vector<std::string> visited;
    std::vector<MSTEdge> mst_edges;
    std::optional<MSTEdge> current_edge;
    double total_weight = 0.0;
};

/**
 * @brief Captures at most max_states snapshots per trace.
 *
 * One recorder is meant for one solver run; it is not thread-safe.
 */
class StepRecorder : public SearchObserver, public MSTObserver {
public:
    explicit StepRecorder(size_t max_states);

    void on_search_event(const SearchEvent& event, const SearchView& view) override;
    void on_mst_event(const MSTEvent& event, const MSTView& view) override;

    const std::vector<SearchState>& search_states() const { return search_states_; }
    const std::vector<MSTState>& mst_states() const { return mst_states_; }

    size_t max_states() const { return max_states_; }
    /// Events seen after the cap was reached.
    size_t dropped() const { return dropped_; }

private:
    double elapsed_ms() const;

    size_t max_states_;
    size_t dropped_ = 0;
    std::chrono::steady_clock::time_point start_;
    std::vector<SearchState> search_states_;
    std::vector<MSTState> mst_states_;
};

}  // namespace flight_routing
