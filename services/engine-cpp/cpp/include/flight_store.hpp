/**
 * @file flight_store.hpp
 * @brief Airport and flight record loading (CSV, Parquet, DuckDB).
 *
 * Record layouts:
 *   airports: code, name, city, country, latitude, longitude
 *   flights:  airline, flight_no, source, dest, departure_time, arrival_time,
 *             duration (minutes), price
 *
 * Loaders return false and report to std::cerr on failure. Airport codes
 * are normalized (trimmed, upper-cased) on input.
 */

#pragma once

#include "flight_graph.hpp"

#include <string>
#include <vector>

namespace flight_routing {

class FlightStore {
public:
    // ========== LOADING ==========

    /// Dispatch on extension: .parquet via Arrow, anything else as CSV.
    bool load_airports(const std::string& path);
    bool load_flights(const std::string& path);

    bool load_airports_csv(const std::string& path);
    bool load_flights_csv(const std::string& path);

    bool load_airports_parquet(const std::string& path);
    bool load_flights_parquet(const std::string& path);

#ifdef HAVE_DUCKDB
    /// Reads the `airports` and `flights` tables (flights reference airports by id).
    bool load_from_duckdb(const std::string& db_path);
#endif

    void clear();

    // ========== ACCESS ==========

    const std::vector<Airport>& airports() const { return airports_; }
    const std::vector<FlightEdge>& flights() const { return flights_; }
    /// Malformed rows skipped by the loaders.
    size_t skipped_rows() const { return skipped_rows_; }

    /// Build an immutable graph snapshot. Throws ValidationError on bad records.
    FlightGraph build_graph() const;

private:
    std::vector<Airport> airports_;
    std::vector<FlightEdge> flights_;
    size_t skipped_rows_ = 0;
};

/**
 * @brief Split one CSV line on commas, honoring double-quoted fields.
 */
std::vector<std::string> split_csv_line(const std::string& line);

}  // namespace flight_routing
