/**
 * @file query_params.cpp
 * @brief Query parameter parsing.
 */

#include "query_params.hpp"
#include "engine_errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace flight_routing {

static bool present(const char* raw) {
    if (!raw) return false;
    for (const char* p = raw; *p; ++p) {
        if (!std::isspace(static_cast<unsigned char>(*p))) return true;
    }
    return false;
}

static std::string lowered(const char* raw) {
    std::string s;
    for (const char* p = raw; *p; ++p) {
        if (!std::isspace(static_cast<unsigned char>(*p))) {
            s += static_cast<char>(std::tolower(static_cast<unsigned char>(*p)));
        }
    }
    return s;
}

std::string require_airport_param(const char* raw, const char* name) {
    if (!present(raw)) {
        throw ValidationError(std::string("Parameter '") + name + "' is required");
    }
    std::string code = normalize_airport_code(raw);
    if (!is_valid_airport_code(code)) {
        throw ValidationError(std::string("Parameter '") + name + "' is not a valid airport code: " + code);
    }
    return code;
}

int parse_int_param(const char* raw, const char* name, int default_value, int min_value, int max_value) {
    if (!present(raw)) return default_value;

    long value = 0;
    try {
        size_t used = 0;
        std::string s = lowered(raw);
        value = std::stol(s, &used);
        if (used != s.size()) throw std::invalid_argument(s);
    } catch (const std::logic_error&) {
        throw ValidationError(std::string(name) + " must be an integer");
    }

    if (value < min_value || value > max_value) {
        throw ValidationError(std::string(name) + " must be between " + std::to_string(min_value) +
                              " and " + std::to_string(max_value));
    }
    return static_cast<int>(value);
}

double require_double_param(const char* raw, const char* name) {
    if (!present(raw)) {
        throw ValidationError(std::string("Parameter '") + name + "' is required");
    }
    return parse_double_param(raw, name, 0.0);
}

double parse_double_param(const char* raw, const char* name, double default_value) {
    if (!present(raw)) return default_value;

    double value = 0.0;
    try {
        size_t used = 0;
        std::string s = lowered(raw);
        value = std::stod(s, &used);
        if (used != s.size()) throw std::invalid_argument(s);
    } catch (const std::logic_error&) {
        throw ValidationError(std::string(name) + " must be a number");
    }
    if (!std::isfinite(value)) {
        throw ValidationError(std::string(name) + " must be finite");
    }
    return value;
}

bool parse_bool_param(const char* raw, const char* name, bool default_value) {
    if (!present(raw)) return default_value;
    std::string s = lowered(raw);
    if (s == "true" || s == "1" || s == "yes") return true;
    if (s == "false" || s == "0" || s == "no") return false;
    throw ValidationError(std::string(name) + " must be true or false");
}

size_t parse_max_states(const char* raw, const TraceLimits& limits) {
    int ceiling = static_cast<int>(std::min<size_t>(limits.max_states,
                                                    static_cast<size_t>(std::numeric_limits<int>::max())));
    return static_cast<size_t>(
        parse_int_param(raw, "max_states", static_cast<int>(limits.default_states), 1, ceiling));
}

WeightMode parse_weight_mode(const char* raw) {
    if (!present(raw)) return WeightMode::PRICE;
    std::string s = lowered(raw);
    if (s == "cheapest" || s == "price") return WeightMode::PRICE;
    if (s == "fastest" || s == "duration") return WeightMode::DURATION;
    if (s == "shortest" || s == "distance") return WeightMode::DISTANCE;
    throw ValidationError("mode must be one of cheapest, fastest, shortest");
}

DijkstraStrategy parse_strategy(const char* raw) {
    if (!present(raw)) return DijkstraStrategy::HEAP;
    std::string s = lowered(raw);
    if (s == "heap") return DijkstraStrategy::HEAP;
    if (s == "array") return DijkstraStrategy::ARRAY;
    throw ValidationError("strategy must be array or heap");
}

MSTAlgorithm parse_mst_algorithm(const char* raw) {
    if (!present(raw)) return MSTAlgorithm::PRIM;
    std::string s = lowered(raw);
    if (s == "prim") return MSTAlgorithm::PRIM;
    if (s == "kruskal") return MSTAlgorithm::KRUSKAL;
    throw ValidationError("algorithm must be prim or kruskal");
}

MSTScope parse_mst_scope(const char* raw) {
    if (!present(raw)) return MSTScope::ROUTE;
    std::string s = lowered(raw);
    if (s == "route") return MSTScope::ROUTE;
    if (s == "full") return MSTScope::FULL;
    throw ValidationError("scope must be route or full");
}

}  // namespace flight_routing
