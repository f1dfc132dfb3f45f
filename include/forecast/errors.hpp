#ifndef FORECAST_ERRORS_HPP
#define FORECAST_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace forecast {

// Base of every error raised while preparing or running a forecast.
class ForecastError : public std::runtime_error {
public:
    explicit ForecastError(const std::string& message)
        : std::runtime_error(message) {}
};

// Missing or duplicate ids, unknown dependencies, cycles.
class StructuralError : public ForecastError {
public:
    explicit StructuralError(const std::string& message)
        : ForecastError(message) {}
};

class UnknownDependencyError : public StructuralError {
public:
    UnknownDependencyError(const std::string& issue, const std::string& dependency)
        : StructuralError("dependency " + dependency + " not found for issue " + issue)
        , issue_(issue)
        , dependency_(dependency) {}

    const std::string& issue() const { return issue_; }
    const std::string& dependency() const { return dependency_; }

private:
    std::string issue_;
    std::string dependency_;
};

class CyclicDependencyError : public StructuralError {
public:
    CyclicDependencyError()
        : StructuralError("dependency graph has a cycle") {}
};

// Missing estimate, inconsistent triplet, unresolved reference.
class EstimationError : public ForecastError {
public:
    explicit EstimationError(const std::string& message)
        : ForecastError(message) {}
};

// No usable history, non-positive capacity or velocity, velocity required but absent.
class VelocityError : public ForecastError {
public:
    explicit VelocityError(const std::string& message)
        : ForecastError(message) {}
};

// Malformed dates, statuses, weekdays, calendar ranges.
class InputError : public ForecastError {
public:
    explicit InputError(const std::string& message)
        : ForecastError(message) {}
};

// Zero iterations, zero issues, empty project or history.
class ConfigurationError : public ForecastError {
public:
    explicit ConfigurationError(const std::string& message)
        : ForecastError(message) {}
};

} // namespace forecast

#endif // FORECAST_ERRORS_HPP
