/**
 * @file ForecastErrors.hpp
 * @brief Exception types raised by the forecaster core
 *
 * All failures are fatal for the operation that raised them:
 * - ConfigurationError: invalid geometry or dimension parameters
 * - DataError: missing or malformed statistics / weights / state files
 * - NumericError: non-finite values leaving a guarded computation
 * - RolloutError: a rollout step failed and the forecast is invalid
 */

#ifndef MMWF_FORECAST_ERRORS_HPP
#define MMWF_FORECAST_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace MMWF {

class ForecastError : public std::runtime_error {
public:
    explicit ForecastError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigurationError : public ForecastError {
public:
    explicit ConfigurationError(const std::string& what)
        : ForecastError("Configuration error: " + what) {}
};

class DataError : public ForecastError {
public:
    explicit DataError(const std::string& what)
        : ForecastError("Data error: " + what) {}
};

class NumericError : public ForecastError {
public:
    explicit NumericError(const std::string& what)
        : ForecastError("Numeric error: " + what) {}
};

class RolloutError : public ForecastError {
public:
    RolloutError(int step, const std::string& what)
        : ForecastError("Rollout error at step " + std::to_string(step) + ": " + what),
          step_(step) {}

    int step() const { return step_; }

private:
    int step_;
};

} // namespace MMWF

#endif // MMWF_FORECAST_ERRORS_HPP
