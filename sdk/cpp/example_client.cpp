// Queries a running flight routing server: cheapest and fastest routes plus
// the Pareto set between two airports.
//
//   ./build/planner_example [base_url] [source] [dest]

#include "planner_client.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    std::string url = argc > 1 ? argv[1] : "http://localhost:8080";
    std::string source = argc > 2 ? argv[2] : "LHE";
    std::string dest = argc > 3 ? argv[3] : "JFK";

    curl_global_init(CURL_GLOBAL_DEFAULT);
    flight_planner::Client client(url);

    json health = client.health();
    if (health.contains("error")) {
        std::cerr << "Server not reachable: " << health["error"] << "\n";
        curl_global_cleanup();
        return 1;
    }
    std::cout << "Server: " << health.value("airports", 0) << " airports, "
              << health.value("flights", 0) << " flights\n";

    for (const char* optimization : {"cheapest", "fastest"}) {
        flight_planner::RouteRequest req;
        req.source = source;
        req.dest = dest;
        req.optimization = optimization;

        json response = client.find_routes(req);
        if (response.contains("error")) {
            std::cout << optimization << ": " << response["error"] << "\n";
            continue;
        }
        const json& route = response["route"];
        std::cout << optimization << ": " << route["path"] << " $" << route["totalPriceUSD"]
                  << " " << route["totalDurationMin"] << " min\n";
    }

    json pareto = client.pareto_routes(source, dest);
    if (pareto.contains("routes")) {
        std::cout << "Pareto: " << pareto["pareto_count"] << " of " << pareto["total_candidates"]
                  << " candidates\n";
    }

    curl_global_cleanup();
    return 0;
}
