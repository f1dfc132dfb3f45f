#ifndef FORECAST_PROJECT_SIMULATION_HPP
#define FORECAST_PROJECT_SIMULATION_HPP

#include "forecast/calendar.hpp"
#include "forecast/date.hpp"
#include "forecast/project.hpp"
#include "forecast/random.hpp"
#include "forecast/report.hpp"
#include "forecast/sampler.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace forecast {

struct SimulationProgress {
    size_t completedIterations = 0;
    double completionPercentage = 0.0;
    double estimatedTimeRemaining = 0.0;  // in seconds
};

/**
 * @brief Runs the critical-path Monte Carlo loop on the calling thread.
 *
 * Every trial visits the items in `order`, starts each one when the last of
 * its dependencies has finished and samples its duration from `sampler`.
 * Three-point and reference durations are elapsed days and are added as is.
 * Story points are spread over their Fibonacci bucket, divided by `velocity`
 * and the resulting capacity days are laid out on `calendar`, counted from
 * `start_date`. The trial's total is the latest finish of any item.
 *
 * @param velocity Story points per capacity day; 0 when the project has no
 *        story-point estimates.
 * @throws ConfigurationError for zero iterations or an empty project.
 * @throws StructuralError when `order` misses an item or visits an item before
 *         one of its dependencies.
 * @throws EstimationError for missing, inconsistent or unresolved estimates.
 * @throws VelocityError when story points are present but `velocity` is not positive.
 */
SimulationOutput simulateCriticalPath(const Project& project,
                                      const std::vector<std::string>& order,
                                      double velocity,
                                      size_t iterations,
                                      const Date& start_date,
                                      ThreePointSampler& sampler,
                                      const TeamCalendar& calendar);

// Full pipeline: velocity, topological order and the trial loop fanned out
// over worker threads, each with its own sampler and capacity cache.
class ProjectSimulator {
public:
    using SamplerFactory = std::function<std::unique_ptr<ThreePointSampler>(size_t worker)>;
    using ProgressCallback = std::function<void(const SimulationProgress&)>;

    struct Parameters {
        size_t iterations = 10000;
        size_t num_threads = 1;  // capped by iterations only, never by the core count
        size_t batch_size = 1000;
        bool seeded = false;
        std::uint64_t seed = 0;  // worker i draws from seed + i
        RandomGeneratorType generator_type = RandomGeneratorType::MERSENNE_TWISTER;
        SamplerFactory sampler_factory = nullptr;  // Beta-PERT when unset
        double progress_update_interval = 0.1;  // seconds
        ProgressCallback progress_callback = nullptr;
    };

    ProjectSimulator() = default;
    explicit ProjectSimulator(Parameters params);

    SimulationOutput run(const Project& project,
                         const TeamCalendar& calendar,
                         const Date& start_date) const;

private:
    Parameters params_;

    void validate_parameters() const;
    size_t worker_count() const;
    std::unique_ptr<ThreePointSampler> make_sampler(size_t worker) const;
    void monitor_progress(const std::atomic<size_t>& completed_iterations,
                          const std::atomic<bool>& simulation_running) const;
};

} // namespace forecast

#endif // FORECAST_PROJECT_SIMULATION_HPP
