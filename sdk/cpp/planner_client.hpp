#pragma once

#include <map>
#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace flight_planner {

struct RouteRequest {
    std::string source;
    std::string dest;
    std::string optimization = "all";  // all, cheapest, fastest, shortest, best_overall, pareto
    int max_stops = 2;
};

struct SimulationRequest {
    std::string source;
    std::string dest;
    std::string mode = "cheapest";
    std::string strategy = "heap";
    int max_states = 300;
};

struct MSTRequest {
    std::string source;
    std::string dest;
    std::string algorithm = "prim";
    std::string scope = "route";
    int max_hops = 3;
    int max_states = 300;
};

// Blocking HTTP client for the flight routing engine. Failures come back
// as {"error": ...} objects, the same shape the server uses.
class Client {
    std::string base_url;

    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
        ((std::string*)userp)->append((char*)contents, size * nmemb);
        return size * nmemb;
    }

    json perform(CURL* curl, const std::string& url) {
        std::string readBuffer;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);

        CURLcode rc = curl_easy_perform(curl);
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        if (rc != CURLE_OK) {
            return json{{"error", curl_easy_strerror(rc)}, {"url", url}};
        }

        json body = json::parse(readBuffer, nullptr, false);
        if (body.is_discarded()) {
            return json{{"error", "parse error"}, {"status", status}, {"raw", readBuffer}};
        }
        return body;
    }

    std::string query_string(CURL* curl, const std::map<std::string, std::string>& params) {
        std::string qs;
        for (const auto& [key, value] : params) {
            char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
            qs += (qs.empty() ? "?" : "&") + key + "=" + (escaped ? escaped : "");
            curl_free(escaped);
        }
        return qs;
    }

public:
    Client(std::string url = "http://localhost:8080") : base_url(url) {}

    json get(const std::string& path, const std::map<std::string, std::string>& params = {}) {
        CURL* curl = curl_easy_init();
        if (!curl) return json{{"error", "curl init failed"}};

        json result = perform(curl, base_url + path + query_string(curl, params));
        curl_easy_cleanup(curl);
        return result;
    }

    json post(const std::string& path, const json& payload) {
        CURL* curl = curl_easy_init();
        if (!curl) return json{{"error", "curl init failed"}};

        std::string data = payload.dump();
        struct curl_slist* headers = NULL;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        json result = perform(curl, base_url + path);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        return result;
    }

    json health() { return get("/health"); }

    json airports() { return get("/api/airports"); }

    json nearest_airports(double lat, double lon, int k = 5, double radius_km = 500.0) {
        return get("/api/airports/nearest", {{"lat", std::to_string(lat)},
                                             {"lon", std::to_string(lon)},
                                             {"k", std::to_string(k)},
                                             {"radius_km", std::to_string(radius_km)}});
    }

    json find_routes(const RouteRequest& req) {
        return get("/api/routes/find", {{"source", req.source},
                                        {"dest", req.dest},
                                        {"optimization", req.optimization},
                                        {"max_stops", std::to_string(req.max_stops)}});
    }

    json pareto_routes(const std::string& source, const std::string& dest, bool enumerate = false, int max_stops = 2) {
        return get("/api/routes/pareto", {{"source", source},
                                          {"dest", dest},
                                          {"enumerate", enumerate ? "true" : "false"},
                                          {"max_stops", std::to_string(max_stops)}});
    }

    json simulate_dijkstra(const SimulationRequest& req) {
        return get("/api/simulate/dijkstra", {{"source", req.source},
                                              {"dest", req.dest},
                                              {"mode", req.mode},
                                              {"strategy", req.strategy},
                                              {"max_states", std::to_string(req.max_states)}});
    }

    json compare_performance(const std::string& source, const std::string& dest, const std::string& mode = "cheapest") {
        return get("/api/simulate/compare-performance", {{"source", source}, {"dest", dest}, {"mode", mode}});
    }

    json simulate_mst(const MSTRequest& req) {
        std::map<std::string, std::string> params = {{"algorithm", req.algorithm},
                                                     {"scope", req.scope},
                                                     {"max_hops", std::to_string(req.max_hops)},
                                                     {"max_states", std::to_string(req.max_states)}};
        if (!req.source.empty()) params["source"] = req.source;
        if (!req.dest.empty()) params["dest"] = req.dest;
        return get("/api/simulate/mst", params);
    }

    json graph_stats() { return get("/api/graph/stats"); }
    json components() { return get("/api/graph/components"); }

    json connectivity(const std::string& source, const std::string& dest) {
        return get("/api/graph/connectivity", {{"source", source}, {"dest", dest}});
    }

    json route_analysis(const std::string& source, const std::string& dest, int max_hops = 3) {
        return get("/api/graph/route-analysis",
                   {{"source", source}, {"dest", dest}, {"max_hops", std::to_string(max_hops)}});
    }

    json reload(const json& sources = json::object()) { return post("/api/data/reload", sources); }
};

} // namespace flight_planner
