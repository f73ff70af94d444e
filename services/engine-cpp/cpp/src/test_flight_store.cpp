/**
 * @file test_flight_store.cpp
 * @brief CSV record loading and graph snapshot build.
 *
 * Usage:
 *   ./build/test_flight_store --airports data/seed_airports.csv --flights data/full_flights.csv
 */

#include "flight_store.hpp"
#include "shortest_path.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>

using namespace flight_routing;
using test_support::TestResult;

namespace fs = std::filesystem;

static void test_split(TestResult& t) {
    auto plain = split_csv_line("a,b,,d");
    t.check(plain.size() == 4 && plain[2].empty(), "empty fields kept");
    auto quoted = split_csv_line("LHE,\"Allama Iqbal, Intl\",Lahore");
    t.check(quoted.size() == 3 && quoted[1] == "Allama Iqbal, Intl", "quoted comma");
    auto escaped = split_csv_line("\"say \"\"hi\"\"\",x");
    t.check(escaped.size() == 2 && escaped[0] == "say \"hi\"", "doubled quote");
}

static void test_seed_files(TestResult& t, const std::string& airports_path, const std::string& flights_path) {
    FlightStore store;
    t.check(store.load_airports(airports_path), "seed airports load");
    t.check(store.load_flights(flights_path), "seed flights load");
    t.check(store.airports().size() == 7, "seven airports");
    t.check(store.skipped_rows() == 0, "no malformed seed rows");

    const auto& lhe = store.airports().front();
    t.check(lhe.code == "LHE" && lhe.name == "Allama Iqbal International Airport" && lhe.city == "Lahore",
            "airport fields");

    const auto& first = store.flights().front();
    t.check(first.flight_no == "PK201" && first.departure_time == "08:00:00" && first.duration_min == 150 &&
                first.price == 200.0,
            "flight fields");

    FlightGraph g = store.build_graph();
    t.check(g.edge_count() == store.flights().size(), "every flight becomes an edge");

    // Extra DXB/DOH/IST/JFK options in the larger dataset keep the three-leg route cheapest
    auto cheapest = ShortestPathEngine().solve(g, "LHE", "JFK", WeightMode::PRICE);
    t.check(cheapest.found && cheapest.route.total_price == 600.0, "cheapest LHE->JFK from files");
}

static void test_malformed(TestResult& t) {
    fs::path dir = fs::temp_directory_path() / "flight_store_test";
    fs::create_directories(dir);
    fs::path airports = dir / "airports.csv";
    fs::path flights = dir / "flights.csv";

    {
        std::ofstream out(airports);
        out << "code,name,city,country,latitude,longitude\n"
            << " aaa ,Alpha,A,X,1.0,2.0\n"
            << "BBB,Beta,B,X,north,2.0\n"
            << "CCC,Gamma\n"
            << "\n"
            << "DDD,Delta,D,X,3.0,4.0\r\n";
    }
    {
        std::ofstream out(flights);
        out << "airline,flight_no,source,dest,departure_time,arrival_time,duration,price\n"
            << "XA,XA1,AAA,DDD,,,90,120.5\n"
            << "XA,XA2,AAA,DDD,,,ninety,100\n"
            << "XA,XA3,,DDD,,,90,100\n"
            << "XA,XA4,ddd,aaa,10:00,11:30,90,\n"
            << "XA,XA5,AAA,DDD,,,nan,100\n"
            << "XA,XA6,AAA,DDD,,,1e12,100\n"
            << "XA,XA7,AAA,DDD,,,90.5,100\n"
            << "XA,XA8,AAA,DDD,,,-30,100\n"
            << "XA,XA9,AAA,DDD,,,45.0,80\n";
    }

    FlightStore store;
    t.check(store.load_airports(airports.string()), "airports with bad rows still load");
    t.check(store.airports().size() == 2, "two good airports");
    t.check(store.airports()[0].code == "AAA", "code normalized on load");
    t.check(store.load_flights(flights.string()), "flights with bad rows still load");
    t.check(store.flights().size() == 3, "three good flights");
    t.check(store.flights()[1].price == 0.0 && store.flights()[1].source == "DDD", "empty price reads as zero");
    t.check(store.flights()[2].flight_no == "XA9" && store.flights()[2].duration_min == 45,
            "integral decimal duration accepted");
    t.check(store.skipped_rows() == 8, "bad rows counted");

    bool bad_duration_kept = false;
    for (const auto& f : store.flights()) {
        if (f.flight_no == "XA5" || f.flight_no == "XA6" || f.flight_no == "XA7" || f.flight_no == "XA8") {
            bad_duration_kept = true;
        }
    }
    t.check(!bad_duration_kept, "non-finite, huge, fractional and negative durations skipped");

    FlightGraph g = store.build_graph();
    t.check(g.vertex_count() == 2 && g.edge_count() == 3, "graph from partial data");

    t.check(!store.load_airports((dir / "missing.csv").string()), "missing file reported");

    store.clear();
    t.check(store.airports().empty() && store.flights().empty() && store.skipped_rows() == 0, "clear");

    fs::remove_all(dir);
}

int main(int argc, char* argv[]) {
    std::string airports_path, flights_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--airports" && i + 1 < argc) {
            airports_path = argv[++i];
        } else if (arg == "--flights" && i + 1 < argc) {
            flights_path = argv[++i];
        }
    }

    TestResult t;
    test_split(t);
    if (!airports_path.empty() && !flights_path.empty()) {
        test_seed_files(t, airports_path, flights_path);
    } else {
        std::cout << "No data files given, skipping seed file checks\n";
    }
    test_malformed(t);

    return t.report("flight_store");
}
