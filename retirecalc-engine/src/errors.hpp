/**
 * @file errors.hpp
 * @brief Exception hierarchy for the retirement simulation engine
 *
 * Callers distinguish three failure classes:
 * - InvalidParameterError: the request itself is wrong (do not retry)
 * - InfrastructureError: worker or resource failure (safe to retry)
 * - RunCancelledError: the caller asked the run to stop
 *
 * NumericInstabilityError never escapes a run; the aggregator excludes the
 * affected scenario and counts it.
 */

#ifndef RETIRECALC_ERRORS_HPP
#define RETIRECALC_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace retirecalc {

/**
 * @brief Base class for all engine errors
 */
class SimulationError : public std::runtime_error {
public:
    explicit SimulationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised by parameter validation before any scenario runs
 */
class InvalidParameterError : public SimulationError {
public:
    InvalidParameterError(const std::string& field, const std::string& message)
        : SimulationError("Invalid parameter '" + field + "': " + message),
          field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/**
 * @brief Raised inside a scenario when a value becomes NaN or infinite
 */
class NumericInstabilityError : public SimulationError {
public:
    NumericInstabilityError(size_t scenario, int year, const std::string& message)
        : SimulationError("Numeric instability in scenario " + std::to_string(scenario) +
                          ", year " + std::to_string(year) + ": " + message),
          scenario_(scenario), year_(year) {}

    size_t scenario() const { return scenario_; }
    int year() const { return year_; }

private:
    size_t scenario_;
    int year_;
};

/**
 * @brief Raised when the worker team or memory fails; the run may be retried
 */
class InfrastructureError : public SimulationError {
public:
    explicit InfrastructureError(const std::string& message)
        : SimulationError("Infrastructure failure (retryable): " + message) {}

    bool retryable() const { return true; }
};

/**
 * @brief Raised when a run is cancelled; no partial statistics are produced
 */
class RunCancelledError : public SimulationError {
public:
    RunCancelledError()
        : SimulationError("Simulation run cancelled") {}
};

/**
 * @brief Raised when a JSON household profile cannot be parsed
 */
class ConfigParseError : public SimulationError {
public:
    explicit ConfigParseError(const std::string& message)
        : SimulationError("Config parse error: " + message) {}
};

} // namespace retirecalc

#endif // RETIRECALC_ERRORS_HPP
