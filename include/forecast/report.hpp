#ifndef FORECAST_REPORT_HPP
#define FORECAST_REPORT_HPP

#include "forecast/date.hpp"
#include "forecast/estimate.hpp"
#include "forecast/project.hpp"
#include "forecast/statistics.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace forecast {

struct SimulationPercentile {
    double days = 0.0;
    std::string date;
};

struct SimulationReport {
    std::string dataSource;
    std::string startDate;
    double velocity = 0.0;  // 0 when no story points were simulated
    size_t iterations = 0;
    size_t simulatedItems = 0;
    SimulationPercentile p0;
    SimulationPercentile p50;
    SimulationPercentile p85;
    SimulationPercentile p100;

    bool hasVelocity() const { return velocity > 0.0; }
};

using WorkPackagePercentiles = PercentileSummary<double>;

struct WorkPackageSimulation {
    std::string id;
    WorkPackagePercentiles percentiles;
};

struct SimulationOutput {
    SimulationReport report;
    std::vector<double> results;  // one total duration per trial, ascending
    std::vector<WorkPackageSimulation> workPackages;
    bool hasWorkPackages = false;  // false for throughput runs
    double mean = 0.0;
    double standardDeviation = 0.0;
    std::chrono::steady_clock::time_point startTime;
    std::chrono::steady_clock::time_point endTime;

    double totalDuration() const {
        return std::chrono::duration<double>(endTime - startTime).count();
    }
};

// Date reached after ceil(days) calendar days, never before start_date.
Date endDateFromDays(const Date& start_date, double days);

SimulationPercentile makePercentile(const Date& start_date, double days);

// Fills the four percentile records of `report` from ascending total durations,
// mapping days to dates with endDateFromDays.
void fillPercentiles(SimulationReport& report, const std::vector<double>& sorted_results,
                     const Date& start_date);

// Final path component, used as the report's data source label.
std::string dataSourceName(const std::string& path);

// Throws InputError when any of the report's dates is not YYYY-MM-DD.
void validateReport(const SimulationReport& report);

// Triplet (p0, p50, p100) a reference estimate borrows from a report.
ThreePointEstimate referenceTriplet(const SimulationReport& report);

// Reads persisted simulation reports for reference estimates.
class ReportLoader {
public:
    virtual ~ReportLoader() = default;
    virtual SimulationReport load(const std::string& report_file_path) const = 0;
};

// Resolves every reference estimate of the project once, before simulation.
// Loader failures and invalid reports surface as EstimationError naming the
// work item and the report path.
void resolveReferenceEstimates(Project& project, const ReportLoader& loader);

} // namespace forecast

#endif // FORECAST_REPORT_HPP
