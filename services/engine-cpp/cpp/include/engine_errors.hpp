/**
 * @file engine_errors.hpp
 * @brief Exception types raised by the flight routing engine.
 *
 * "No route found" is not an error: solvers report it through the
 * `found` flag of their result objects.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace flight_routing {

/**
 * @brief Missing or malformed query parameter or input record.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Airport code that is not part of the graph.
 */
class UnknownAirport : public std::out_of_range {
public:
    explicit UnknownAirport(const std::string& code)
        : std::out_of_range("Unknown airport: " + code), code_(code) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

/**
 * @brief Internal invariant broken (e.g. negative weight reaching Dijkstra).
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

}  // namespace flight_routing
