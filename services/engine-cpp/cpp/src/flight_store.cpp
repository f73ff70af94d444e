/**
 * @file flight_store.cpp
 * @brief Record loaders for airports and flights.
 */

#include "flight_store.hpp"

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

#ifdef HAVE_DUCKDB
#include <duckdb.hpp>
#endif

namespace fs = std::filesystem;

namespace flight_routing {

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> tokens;
    std::string token;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                token += '"';
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == ',' && !quoted) {
            tokens.push_back(std::move(token));
            token.clear();
        } else if (c != '\r') {
            token += c;
        }
    }
    tokens.push_back(std::move(token));
    return tokens;
}

static bool is_parquet(const std::string& path) {
    return fs::path(path).extension() == ".parquet";
}

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Empty numeric cells read as 0
static double parse_number(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) return 0.0;
    size_t used = 0;
    double v = std::stod(s, &used);
    if (used != s.size()) throw std::invalid_argument("trailing characters in '" + s + "'");
    return v;
}

// Durations are whole, non-negative minutes that fit an int
static bool whole_minutes(double v) {
    return std::isfinite(v) && v >= 0 && v <= std::numeric_limits<int>::max() && v == std::floor(v);
}

// ============================================================
// LOADING - CSV
// ============================================================

bool FlightStore::load_airports(const std::string& path) {
    return is_parquet(path) ? load_airports_parquet(path) : load_airports_csv(path);
}

bool FlightStore::load_flights(const std::string& path) {
    return is_parquet(path) ? load_flights_parquet(path) : load_flights_csv(path);
}

bool FlightStore::load_airports_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Cannot open airports file: " << path << std::endl;
        return false;
    }

    std::string line;
    std::getline(file, line); // Skip header

    size_t line_no = 1;
    size_t before = airports_.size();
    while (std::getline(file, line)) {
        line_no++;
        if (trim(line).empty()) continue;

        auto tokens = split_csv_line(line);
        if (tokens.size() < 6) {
            std::cerr << "  " << path << ":" << line_no << ": expected 6 columns" << std::endl;
            skipped_rows_++;
            continue;
        }

        Airport a;
        a.code = normalize_airport_code(tokens[0]);
        a.name = trim(tokens[1]);
        a.city = trim(tokens[2]);
        a.country = trim(tokens[3]);
        try {
            a.latitude = std::stod(tokens[4]);
            a.longitude = std::stod(tokens[5]);
        } catch (const std::exception& e) {
            std::cerr << "  " << path << ":" << line_no << ": bad coordinates (" << e.what() << ")" << std::endl;
            skipped_rows_++;
            continue;
        }
        airports_.push_back(std::move(a));
    }

    std::cout << "Loaded " << (airports_.size() - before) << " airports from " << path << std::endl;
    return airports_.size() > before;
}

bool FlightStore::load_flights_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Cannot open flights file: " << path << std::endl;
        return false;
    }

    std::string line;
    std::getline(file, line); // Skip header

    size_t line_no = 1;
    size_t before = flights_.size();
    while (std::getline(file, line)) {
        line_no++;
        if (trim(line).empty()) continue;

        auto tokens = split_csv_line(line);
        if (tokens.size() < 8) {
            std::cerr << "  " << path << ":" << line_no << ": expected 8 columns" << std::endl;
            skipped_rows_++;
            continue;
        }

        FlightEdge f;
        f.airline = trim(tokens[0]);
        f.flight_no = trim(tokens[1]);
        f.source = normalize_airport_code(tokens[2]);
        f.dest = normalize_airport_code(tokens[3]);
        f.departure_time = trim(tokens[4]);
        f.arrival_time = trim(tokens[5]);
        double minutes = 0.0;
        try {
            minutes = parse_number(tokens[6]);
            f.price = parse_number(tokens[7]);
        } catch (const std::exception& e) {
            std::cerr << "  " << path << ":" << line_no << ": bad duration/price (" << e.what() << ")" << std::endl;
            skipped_rows_++;
            continue;
        }
        if (!whole_minutes(minutes)) {
            std::cerr << "  " << path << ":" << line_no << ": duration '" << trim(tokens[6])
                      << "' is not whole minutes" << std::endl;
            skipped_rows_++;
            continue;
        }
        f.duration_min = static_cast<int>(minutes);
        if (f.source.empty() || f.dest.empty()) {
            skipped_rows_++;
            continue;
        }
        flights_.push_back(std::move(f));
    }

    std::cout << "Loaded " << (flights_.size() - before) << " flights from " << path << std::endl;
    return flights_.size() > before;
}

// ============================================================
// LOADING - PARQUET
// ============================================================

static std::shared_ptr<arrow::Table> read_parquet_table(const std::string& filepath) {
    auto result = arrow::io::ReadableFile::Open(filepath);
    if (!result.ok()) {
        std::cerr << "Cannot open " << filepath << ": " << result.status().ToString() << std::endl;
        return nullptr;
    }

    std::unique_ptr<parquet::arrow::FileReader> reader;
    auto status = parquet::arrow::OpenFile(*result, arrow::default_memory_pool(), &reader);
    if (!status.ok()) {
        std::cerr << "Not a parquet file " << filepath << ": " << status.ToString() << std::endl;
        return nullptr;
    }

    std::shared_ptr<arrow::Table> table;
    status = reader->ReadTable(&table);
    if (!status.ok()) {
        std::cerr << "Parquet read failed " << filepath << ": " << status.ToString() << std::endl;
        return nullptr;
    }

    auto combined = table->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        std::cerr << "Parquet combine failed " << filepath << ": " << combined.status().ToString() << std::endl;
        return nullptr;
    }
    return *combined;
}

// Single-chunk column by name, nullptr (with a message) when absent
static std::shared_ptr<arrow::Array> column(const std::shared_ptr<arrow::Table>& table,
                                            const std::string& name,
                                            const std::string& filepath) {
    auto col = table->GetColumnByName(name);
    if (!col || col->num_chunks() == 0) {
        std::cerr << filepath << ": missing column '" << name << "'" << std::endl;
        return nullptr;
    }
    return col->chunk(0);
}

static std::string string_at(const std::shared_ptr<arrow::Array>& arr, int64_t i) {
    if (arr->IsNull(i)) return "";
    return std::static_pointer_cast<arrow::StringArray>(arr)->GetString(i);
}

static double number_at(const std::shared_ptr<arrow::Array>& arr, int64_t i) {
    if (arr->IsNull(i)) return 0.0;
    switch (arr->type_id()) {
        case arrow::Type::DOUBLE: return std::static_pointer_cast<arrow::DoubleArray>(arr)->Value(i);
        case arrow::Type::FLOAT: return std::static_pointer_cast<arrow::FloatArray>(arr)->Value(i);
        case arrow::Type::INT32: return std::static_pointer_cast<arrow::Int32Array>(arr)->Value(i);
        case arrow::Type::INT64: return static_cast<double>(std::static_pointer_cast<arrow::Int64Array>(arr)->Value(i));
        default:
            throw std::invalid_argument("unsupported numeric column type " + arr->type()->ToString());
    }
}

bool FlightStore::load_airports_parquet(const std::string& path) {
    auto table = read_parquet_table(path);
    if (!table || table->num_rows() == 0) return false;

    auto code = column(table, "code", path);
    auto name = column(table, "name", path);
    auto city = column(table, "city", path);
    auto country = column(table, "country", path);
    auto lat = column(table, "latitude", path);
    auto lon = column(table, "longitude", path);
    if (!code || !name || !city || !country || !lat || !lon) return false;

    try {
        for (int64_t i = 0; i < table->num_rows(); ++i) {
            if (lat->IsNull(i) || lon->IsNull(i)) {
                skipped_rows_++;
                continue;
            }
            Airport a;
            a.code = normalize_airport_code(string_at(code, i));
            a.name = string_at(name, i);
            a.city = string_at(city, i);
            a.country = string_at(country, i);
            a.latitude = number_at(lat, i);
            a.longitude = number_at(lon, i);
            airports_.push_back(std::move(a));
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << path << ": " << e.what() << std::endl;
        return false;
    }

    std::cout << "Loaded " << table->num_rows() << " airport rows from " << path << std::endl;
    return true;
}

bool FlightStore::load_flights_parquet(const std::string& path) {
    auto table = read_parquet_table(path);
    if (!table || table->num_rows() == 0) return false;

    auto airline = column(table, "airline", path);
    auto flight_no = column(table, "flight_no", path);
    auto source = column(table, "source", path);
    auto dest = column(table, "dest", path);
    auto departure = column(table, "departure_time", path);
    auto arrival = column(table, "arrival_time", path);
    auto duration = column(table, "duration", path);
    auto price = column(table, "price", path);
    if (!airline || !flight_no || !source || !dest || !departure || !arrival || !duration || !price) {
        return false;
    }

    try {
        for (int64_t i = 0; i < table->num_rows(); ++i) {
            FlightEdge f;
            f.airline = string_at(airline, i);
            f.flight_no = string_at(flight_no, i);
            f.source = normalize_airport_code(string_at(source, i));
            f.dest = normalize_airport_code(string_at(dest, i));
            f.departure_time = string_at(departure, i);
            f.arrival_time = string_at(arrival, i);
            double minutes = number_at(duration, i);
            if (!whole_minutes(minutes)) {
                std::cerr << "  " << path << ": row " << i << ": duration " << minutes
                          << " is not whole minutes" << std::endl;
                skipped_rows_++;
                continue;
            }
            f.duration_min = static_cast<int>(minutes);
            f.price = number_at(price, i);
            if (f.source.empty() || f.dest.empty()) {
                skipped_rows_++;
                continue;
            }
            flights_.push_back(std::move(f));
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << path << ": " << e.what() << std::endl;
        return false;
    }

    std::cout << "Loaded " << table->num_rows() << " flight rows from " << path << std::endl;
    return true;
}

// ============================================================
// LOADING - DUCKDB
// ============================================================

#ifdef HAVE_DUCKDB

bool FlightStore::load_from_duckdb(const std::string& db_path) {
    std::cout << "Loading flights from DuckDB: " << db_path << std::endl;

    try {
        duckdb::DBConfig config;
        config.options.access_mode = duckdb::AccessMode::READ_ONLY;
        duckdb::DuckDB db(db_path, &config);
        duckdb::Connection con(db);

        clear();

        auto result = con.Query(
            "SELECT code, name, city, country, latitude, longitude FROM airports "
            "WHERE latitude IS NOT NULL AND longitude IS NOT NULL");
        if (result->HasError()) {
            std::cerr << "Error loading airports: " << result->GetError() << std::endl;
            return false;
        }

        while (auto chunk = result->Fetch()) {
            for (idx_t i = 0; i < chunk->size(); i++) {
                auto text = [&](idx_t col) {
                    auto v = chunk->GetValue(col, i);
                    return v.IsNull() ? std::string() : v.ToString();
                };
                Airport a;
                a.code = normalize_airport_code(text(0));
                a.name = text(1);
                a.city = text(2);
                a.country = text(3);
                a.latitude = chunk->GetValue(4, i).GetValue<double>();
                a.longitude = chunk->GetValue(5, i).GetValue<double>();
                airports_.push_back(std::move(a));
            }
        }
        std::cout << "  Loaded " << airports_.size() << " airports" << std::endl;

        // Flights reference airports by id; unresolved ids come back as NULL codes
        result = con.Query(
            "SELECT f.airline, f.flight_no, sa.code, da.code, "
            "CAST(f.departure_time AS VARCHAR), CAST(f.arrival_time AS VARCHAR), "
            "COALESCE(f.duration, 0), COALESCE(f.price, 0) "
            "FROM flights f "
            "LEFT JOIN airports sa ON f.source_airport = sa.id "
            "LEFT JOIN airports da ON f.dest_airport = da.id "
            "ORDER BY f.id");
        if (result->HasError()) {
            std::cerr << "Error loading flights: " << result->GetError() << std::endl;
            return false;
        }

        while (auto chunk = result->Fetch()) {
            for (idx_t i = 0; i < chunk->size(); i++) {
                auto text = [&](idx_t col) {
                    auto v = chunk->GetValue(col, i);
                    return v.IsNull() ? std::string() : v.ToString();
                };
                FlightEdge f;
                f.airline = text(0);
                f.flight_no = text(1);
                f.source = normalize_airport_code(text(2));
                f.dest = normalize_airport_code(text(3));
                f.departure_time = text(4);
                f.arrival_time = text(5);
                double minutes = chunk->GetValue(6, i).GetValue<double>();
                if (!whole_minutes(minutes)) {
                    skipped_rows_++;
                    continue;
                }
                f.duration_min = static_cast<int>(minutes);
                f.price = chunk->GetValue(7, i).GetValue<double>();
                if (f.source.empty() || f.dest.empty()) {
                    skipped_rows_++;
                    continue;
                }
                flights_.push_back(std::move(f));
            }
        }
        std::cout << "  Loaded " << flights_.size() << " flights" << std::endl;

        return !airports_.empty();

    } catch (const std::exception& e) {
        std::cerr << "DuckDB error: " << e.what() << std::endl;
        return false;
    }
}

#endif // HAVE_DUCKDB

// ============================================================
// GRAPH
// ============================================================

void FlightStore::clear() {
    airports_.clear();
    flights_.clear();
    skipped_rows_ = 0;
}

FlightGraph FlightStore::build_graph() const {
    FlightGraph graph = FlightGraph::build(airports_, flights_);
    std::cout << "Graph built: " << graph.vertex_count() << " airports, "
              << graph.edge_count() << " flights";
    if (skipped_rows_ > 0) std::cout << " (" << skipped_rows_ << " rows skipped)";
    std::cout << std::endl;
    return graph;
}

}  // namespace flight_routing
