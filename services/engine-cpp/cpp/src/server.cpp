/**
 * @file server.cpp
 * @brief HTTP server for the flight routing API using Crow framework.
 *
 * Queries run against an immutable graph snapshot; a reload builds a new
 * snapshot and swaps it in, so in-flight queries keep the one they started with.
 */

#include "airport_locator.hpp"
#include "engine_errors.hpp"
#include "flight_store.hpp"
#include "graph_analyzer.hpp"
#include "json_codec.hpp"
#include "mst_engine.hpp"
#include "pareto_finder.hpp"
#include "query_params.hpp"
#include "route_planner.hpp"

#include <crow.h>
#include <nlohmann/json.hpp>
#include <arrow/memory_pool.h>
#include <malloc.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>

using json = nlohmann::json;
using namespace flight_routing;

// Graph plus spatial index built from one load
struct Snapshot {
    std::shared_ptr<const FlightGraph> graph;
    std::shared_ptr<const AirportLocator> locator;
    std::string source;
};

std::shared_ptr<const Snapshot> g_snapshot;
std::mutex g_snapshot_mutex;

// Server configuration
struct ServerConfig {
    int port = 8080;
    std::string host = "0.0.0.0";
    std::string index_type = "rtree";
    std::string airports_path;
    std::string flights_path;
    std::string db_path;
    TraceLimits trace;
};

ServerConfig g_config;

std::shared_ptr<const Snapshot> get_snapshot() {
    std::lock_guard<std::mutex> lock(g_snapshot_mutex);
    return g_snapshot;
}

// ============================================================
// LOADING
// ============================================================

bool install_snapshot(const FlightStore& store, const std::string& source) {
    auto snap = std::make_shared<Snapshot>();
    snap->source = source;

    try {
        snap->graph = std::make_shared<const FlightGraph>(store.build_graph());
        auto locator = std::make_shared<AirportLocator>(parse_spatial_index_type(g_config.index_type));
        std::cout << "  Building spatial index (" << g_config.index_type << ")...\n";
        locator->build(snap->graph->airports());
        snap->locator = std::move(locator);
    } catch (const ValidationError& e) {
        std::cerr << "  Invalid records: " << e.what() << "\n";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(g_snapshot_mutex);
        g_snapshot = std::move(snap);
    }

    // Reclaim memory from the system after loading
    arrow::default_memory_pool()->ReleaseUnused();
    malloc_trim(0);
    return true;
}

bool load_files(const std::string& airports_path, const std::string& flights_path) {
    std::cout << "Loading flight data...\n";
    std::cout << "  Airports: " << airports_path << "\n";
    std::cout << "  Flights: " << flights_path << "\n";

    FlightStore store;
    if (!store.load_airports(airports_path)) {
        std::cerr << "  Failed to load airports\n";
        return false;
    }
    if (!store.load_flights(flights_path)) {
        std::cerr << "  Failed to load flights\n";
        return false;
    }
    return install_snapshot(store, "files");
}

#ifdef HAVE_DUCKDB
bool load_duckdb(const std::string& db_path) {
    std::cout << "Loading flight data from DuckDB...\n";
    std::cout << "  Database: " << db_path << "\n";

    FlightStore store;
    if (!store.load_from_duckdb(db_path)) {
        std::cerr << "  Failed to load from DuckDB\n";
        return false;
    }
    return install_snapshot(store, "duckdb");
}
#endif

// Load config from JSON file
bool load_config(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        std::cerr << "Config file not found: " << config_path << "\n";
        return false;
    }

    try {
        json config = json::parse(file);

        // Server settings
        if (config.contains("port")) g_config.port = config["port"];
        if (config.contains("host")) g_config.host = config["host"];
        if (config.contains("index_type")) g_config.index_type = config["index_type"];

        if (config.contains("data")) {
            const auto& data = config["data"];
            g_config.airports_path = data.value("airports_path", g_config.airports_path);
            g_config.flights_path = data.value("flights_path", g_config.flights_path);
            g_config.db_path = data.value("db_path", g_config.db_path);
        }

        if (config.contains("trace")) {
            const auto& trace = config["trace"];
            g_config.trace.default_states = trace.value("default_max_states", g_config.trace.default_states);
            g_config.trace.max_states = trace.value("max_states_ceiling", g_config.trace.max_states);
        }

        std::cout << "Loaded config from: " << config_path << "\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

// ============================================================
// RESPONSES
// ============================================================

crow::response json_response(int code, const json& body) {
    crow::response res(code, body.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

crow::response error_response(int code, const std::string& message) {
    return json_response(code, {{"success", false}, {"error", message}});
}

// Runs a handler against the current snapshot and maps engine errors to status codes
template <typename Handler>
crow::response with_snapshot(Handler&& handler) {
    auto snap = get_snapshot();
    if (!snap) {
        return error_response(503, "No flight data loaded");
    }

    try {
        return handler(*snap);
    } catch (const ValidationError& e) {
        return error_response(400, e.what());
    } catch (const UnknownAirport& e) {
        return error_response(404, e.what());
    } catch (const InvariantViolation& e) {
        std::cerr << "Invariant violation: " << e.what() << "\n";
        return error_response(500, e.what());
    } catch (const json::exception& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        std::cerr << "Request failed: " << e.what() << "\n";
        return error_response(500, e.what());
    }
}

crow::response no_route() {
    return error_response(404, "No route found");
}

int main(int argc, char* argv[]) {
    std::cout << "=== Flight Routing Engine HTTP Server ===\n\n";

    // Config file first, so command-line flags override it
    std::string config_path = "config/server.json";
    bool explicit_config = false;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            explicit_config = true;
        }
    }
    std::ifstream config_check(config_path);
    if (config_check.good() || explicit_config) {
        config_check.close();
        load_config(config_path);
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if (arg == "--port" && i + 1 < argc) {
            g_config.port = std::stoi(argv[++i]);
        } else if (arg == "--airports" && i + 1 < argc) {
            g_config.airports_path = argv[++i];
        } else if (arg == "--flights" && i + 1 < argc) {
            g_config.flights_path = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            g_config.db_path = argv[++i];
        } else if (arg == "--index" && i + 1 < argc) {
            g_config.index_type = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: flight_routing_server [options]\n"
                      << "  --config PATH      Config file (default: config/server.json)\n"
                      << "  --port PORT        Server port (default: 8080)\n"
                      << "  --airports PATH    Airports CSV or Parquet file\n"
                      << "  --flights PATH     Flights CSV or Parquet file\n"
                      << "  --db PATH          DuckDB database with airports/flights tables\n"
                      << "  --index TYPE       Spatial index: h3 or rtree (default: rtree)\n";
            return 0;
        }
    }

    try {
        parse_spatial_index_type(g_config.index_type);
    } catch (const ValidationError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

#ifdef HAVE_DUCKDB
    if (!g_config.db_path.empty()) {
        load_duckdb(g_config.db_path);
    } else
#endif
    if (!g_config.airports_path.empty() && !g_config.flights_path.empty()) {
        load_files(g_config.airports_path, g_config.flights_path);
    }

    // Create Crow app
    crow::SimpleApp app;

    // ============================================================
    // HEALTH ENDPOINT
    // ============================================================
    CROW_ROUTE(app, "/health")([]() {
        auto snap = get_snapshot();
        json response = {
            {"status", "healthy"},
            {"engine", "flight_routing"},
            {"data_loaded", snap != nullptr},
            {"airports", snap ? snap->graph->vertex_count() : 0},
            {"flights", snap ? snap->graph->edge_count() : 0},
            {"index_type", g_config.index_type}
        };
        return json_response(200, response);
    });

    // ============================================================
    // RELOAD DATA
    // ============================================================
    CROW_ROUTE(app, "/api/data/reload").methods("POST"_method)([](const crow::request& req) {
        try {
            json body = req.body.empty() ? json::object() : json::parse(req.body);
            std::string db_path = body.value("db_path", g_config.db_path);

#ifdef HAVE_DUCKDB
            if (!db_path.empty()) {
                bool success = load_duckdb(db_path);
                return json_response(success ? 200 : 500, {{"success", success}, {"source", "duckdb"}});
            }
#else
            if (!db_path.empty()) {
                return error_response(400, "Server built without DuckDB support");
            }
#endif

            std::string airports = body.value("airports_path", g_config.airports_path);
            std::string flights = body.value("flights_path", g_config.flights_path);
            if (airports.empty() || flights.empty()) {
                return error_response(400, "db_path or airports_path+flights_path required");
            }

            bool success = load_files(airports, flights);
            json response = {{"success", success}, {"source", "files"}};
            if (success) {
                auto snap = get_snapshot();
                response["airports"] = snap->graph->vertex_count();
                response["flights"] = snap->graph->edge_count();
            }
            return json_response(success ? 200 : 500, response);

        } catch (const json::exception& e) {
            return error_response(400, e.what());
        }
    });

    // ============================================================
    // AIRPORTS
    // ============================================================
    CROW_ROUTE(app, "/api/airports")([]() {
        return with_snapshot([](const Snapshot& snap) {
            std::vector<Airport> airports = snap.graph->airports();
            std::sort(airports.begin(), airports.end(), [](const Airport& a, const Airport& b) {
                if (a.city != b.city) return a.city < b.city;
                return a.name < b.name;
            });
            return json_response(200, {{"success", true}, {"count", airports.size()}, {"airports", airports}});
        });
    });

    CROW_ROUTE(app, "/api/airports/nearest")([](const crow::request& req) {
        return with_snapshot([&req](const Snapshot& snap) {
            double lat = require_double_param(req.url_params.get("lat"), "lat");
            double lon = require_double_param(req.url_params.get("lon"), "lon");
            int k = parse_int_param(req.url_params.get("k"), "k", 5, 1, 100);
            double radius = parse_double_param(req.url_params.get("radius_km"), "radius_km", 500.0);

            auto nearest = snap.locator->find_nearest(lat, lon, static_cast<size_t>(k), radius);
            return json_response(200, {
                {"success", true},
                {"lat", lat},
                {"lon", lon},
                {"k", k},
                {"radius_km", radius},
                {"index_type", spatial_index_name(snap.locator->type())},
                {"airports", nearest}
            });
        });
    });

    // ============================================================
    // ROUTES
    // ============================================================
    CROW_ROUTE(app, "/api/routes/find")([](const crow::request& req) {
        return with_snapshot([&req](const Snapshot& snap) {
            std::string source = require_airport_param(req.url_params.get("source"), "source");
            std::string dest = require_airport_param(req.url_params.get("dest"), "dest");
            const char* raw_mode = req.url_params.get("optimization");
            RouteMode mode = raw_mode ? parse_route_mode(raw_mode) : RouteMode::ALL;
            int max_stops = parse_int_param(req.url_params.get("max_stops"), "max_stops", 2, 0, MAX_STOPS);

            RoutePlanner planner(*snap.graph);

            switch (mode) {
                case RouteMode::ALL: {
                    auto routes = planner.enumerate_routes(source, dest, max_stops);
                    auto comparison = planner.compare_all_algorithms(source, dest);
                    return json_response(200, {
                        {"success", true},
                        {"total_routes", routes.size()},
                        {"routes", routes},
                        {"algorithm_results", comparison}
                    });
                }
                case RouteMode::PARETO: {
                    ParetoResult pareto = ParetoRouteFinder().find(*snap.graph, source, dest);
                    if (pareto.pareto_count == 0) return no_route();
                    json response = pareto;
                    response["success"] = true;
                    response["algorithm_used"] = "pareto_optimal";
                    return json_response(200, response);
                }
                case RouteMode::BEST_OVERALL: {
                    auto best = planner.find_route(source, dest, mode);
                    if (!best) return no_route();
                    auto comparison = planner.compare_all_algorithms(source, dest);
                    return json_response(200, {
                        {"success", true},
                        {"route", *best},
                        {"algorithm_used", "multi_criteria_dijkstra"},
                        {"comparison", {
                            {"cheapest", optional_route(comparison.cheapest)},
                            {"fastest", optional_route(comparison.fastest)},
                            {"shortest", optional_route(comparison.shortest)}
                        }}
                    });
                }
                default: {
                    auto best = planner.find_route(source, dest, mode);
                    if (!best) return no_route();
                    return json_response(200, {
                        {"success", true},
                        {"route", *best},
                        {"algorithm_used", route_mode_name(mode)}
                    });
                }
            }
        });
    });

    CROW_ROUTE(app, "/api/routes/pareto")([](const crow::request& req) {
        return with_snapshot([&req](const Snapshot& snap) {
            std::string source = require_airport_param(req.url_params.get("source"), "source");
            std::string dest = require_airport_param(req.url_params.get("dest"), "dest");

            ParetoOptions options;
            options.enumerate_stops = parse_bool_param(req.url_params.get("enumerate"), "enumerate", false);
            options.max_stops = parse_int_param(req.url_params.get("max_stops"), "max_stops", 2, 0, MAX_STOPS);

            ParetoResult pareto = ParetoRouteFinder(options).find(*snap.graph, source, dest);
            if (pareto.pareto_count == 0) return no_route();

            json response = pareto;
            response["success"] = true;
            response["algorithm_used"] = "pareto_optimal";
            return json_response(200, response);
        });
    });

    // ============================================================
    // SIMULATION
    // ============================================================
    CROW_ROUTE(app, "/api/simulate/dijkstra")([](const crow::request& req) {
        return with_snapshot([&req](const Snapshot& snap) {
            std::string source = require_airport_param(req.url_params.get("source"), "source");
            std::string dest = require_airport_param(req.url_params.get("dest"), "dest");
            WeightMode mode = parse_weight_mode(req.url_params.get("mode"));
            size_t max_states = parse_max_states(req.url_params.get("max_states"), g_config.trace);
            DijkstraStrategy strategy = parse_strategy(req.url_params.get("strategy"));

            SimulationResult sim = RoutePlanner(*snap.graph).simulate_dijkstra(source, dest, mode, max_states, strategy);
            return json_response(200, {
                {"success", true},
                {"mode", weight_mode_name(mode)},
                {"strategy", strategy_name(strategy)},
                {"found", sim.result.found},
                {"route", sim.result.found ? json(sim.result.route) : json(nullptr)},
                {"states", sim.states},
                {"max_states", max_states},
                {"truncated", sim.truncated}
            });
        });
    });

    CROW_ROUTE(app, "/api/simulate/compare-performance")([](const crow::request& req) {
        return with_snapshot([&req](const Snapshot& snap) {
            std::string source = require_airport_param(req.url_params.get("source"), "source");
            std::string dest = require_airport_param(req.url_params.get("dest"), "dest");
            WeightMode mode = parse_weight_mode(req.url_params.get("mode"));

            auto cmp = RoutePlanner(*snap.graph).compare_dijkstra_implementations(source, dest, mode);
            json response = implementation_comparison_json(cmp);
            response["success"] = true;
            response["mode"] = weight_mode_name(mode);
            return json_response(200, response);
        });
    });

    CROW_ROUTE(app, "/api/simulate/mst")([](const crow::request& req) {
        return with_snapshot([&req](const Snapshot& snap) {
            MSTScope scope = parse_mst_scope(req.url_params.get("scope"));
            MSTAlgorithm algorithm = parse_mst_algorithm(req.url_params.get("algorithm"));
            size_t max_states = parse_max_states(req.url_params.get("max_states"), g_config.trace);

            std::string source, dest;
            if (scope == MSTScope::ROUTE || req.url_params.get("source")) {
                source = require_airport_param(req.url_params.get("source"), "source");
            }
            if (scope == MSTScope::ROUTE || req.url_params.get("dest")) {
                dest = require_airport_param(req.url_params.get("dest"), "dest");
            }
            int max_hops = parse_int_param(req.url_params.get("max_hops"), "max_hops", 3, 1, 6);

            UndirectedPriceGraph view = build_mst_view(*snap.graph, source, dest, scope, max_hops);
            MSTSimulation sim = MSTEngine().simulate(view, algorithm, max_states, source);

            json response = mst_result_json(sim.result);
            response["success"] = true;
            response["scope"] = mst_scope_name(scope);
            response["states"] = sim.states;
            response["max_states"] = max_states;
            response["truncated"] = sim.truncated;
            return json_response(200, response);
        });
    });

    // ============================================================
    // GRAPH ANALYSIS
    // ============================================================
    CROW_ROUTE(app, "/api/graph/stats")([]() {
        return with_snapshot([](const Snapshot& snap) {
            json response = GraphAnalyzer(*snap.graph).stats();
            response["success"] = true;
            return json_response(200, response);
        });
    });

    CROW_ROUTE(app, "/api/graph/adjacency-list")([]() {
        return with_snapshot([](const Snapshot& snap) {
            return json_response(200, {
                {"success", true},
                {"adjacency_list", GraphAnalyzer(*snap.graph).adjacency_list()}
            });
        });
    });

    CROW_ROUTE(app, "/api/graph/adjacency-matrix")([]() {
        return with_snapshot([](const Snapshot& snap) {
            json response = GraphAnalyzer(*snap.graph).adjacency_matrix();
            response["success"] = true;
            return json_response(200, response);
        });
    });

    CROW_ROUTE(app, "/api/graph/components")([]() {
        return with_snapshot([](const Snapshot& snap) {
            json response = GraphAnalyzer(*snap.graph).connected_components();
            response["success"] = true;
            return json_response(200, response);
        });
    });

    CROW_ROUTE(app, "/api/graph/connectivity")([](const crow::request& req) {
        return with_snapshot([&req](const Snapshot& snap) {
            std::string source = require_airport_param(req.url_params.get("source"), "source");
            std::string dest = require_airport_param(req.url_params.get("dest"), "dest");

            json response = GraphAnalyzer(*snap.graph).connectivity(source, dest);
            response["success"] = true;
            return json_response(200, response);
        });
    });

    CROW_ROUTE(app, "/api/graph/route-analysis")([](const crow::request& req) {
        return with_snapshot([&req](const Snapshot& snap) {
            std::string source = require_airport_param(req.url_params.get("source"), "source");
            std::string dest = require_airport_param(req.url_params.get("dest"), "dest");
            int max_hops = parse_int_param(req.url_params.get("max_hops"), "max_hops", 3, 1, 6);

            json response = GraphAnalyzer(*snap.graph).route_subgraph(source, dest, max_hops);
            response["success"] = true;
            return json_response(200, response);
        });
    });

    std::cout << "Starting Flight Routing Server on " << g_config.host << ":" << g_config.port << "...\n";
    app.bindaddr(g_config.host).port(g_config.port).multithreaded().run();

    return 0;
}
