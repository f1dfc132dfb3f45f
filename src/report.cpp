#include "forecast/report.hpp"
#include "forecast/errors.hpp"
#include <algorithm>
#include <cmath>

namespace forecast {

Date endDateFromDays(const Date& start_date, double days) {
    double whole_days = std::max(0.0, std::ceil(days));
    return start_date.addDays(static_cast<std::int64_t>(whole_days));
}

SimulationPercentile makePercentile(const Date& start_date, double days) {
    SimulationPercentile percentile;
    percentile.days = days;
    percentile.date = endDateFromDays(start_date, days).toString();
    return percentile;
}

void fillPercentiles(SimulationReport& report, const std::vector<double>& sorted_results,
                     const Date& start_date) {
    PercentileSummary<double> summary = StatisticalAnalysis<double>::summarizeSorted(sorted_results);
    report.startDate = start_date.toString();
    report.p0 = makePercentile(start_date, summary.p0);
    report.p50 = makePercentile(start_date, summary.p50);
    report.p85 = makePercentile(start_date, summary.p85);
    report.p100 = makePercentile(start_date, summary.p100);
}

std::string dataSourceName(const std::string& path) {
    size_t end = path.find_last_not_of("/\\");
    if (end == std::string::npos) {
        return path;
    }
    size_t separator = path.find_last_of("/\\", end);
    if (separator == std::string::npos) {
        return path.substr(0, end + 1);
    }
    return path.substr(separator + 1, end - separator);
}

void validateReport(const SimulationReport& report) {
    Date::parse(report.startDate);
    Date::parse(report.p0.date);
    Date::parse(report.p50.date);
    Date::parse(report.p85.date);
    Date::parse(report.p100.date);
}

ThreePointEstimate referenceTriplet(const SimulationReport& report) {
    return ThreePointEstimate(report.p0.days, report.p50.days, report.p100.days);
}

void resolveReferenceEstimates(Project& project, const ReportLoader& loader) {
    for (auto& item : project.workItems()) {
        if (item.estimate.type() != Estimate::Type::REFERENCE) {
            continue;
        }
        const std::string& path = item.estimate.reportFilePath();
        SimulationReport report;
        try {
            report = loader.load(path);
            validateReport(report);
        } catch (const std::exception& e) {
            throw EstimationError("failed to resolve reference estimate for issue " + item.id +
                                  " from " + path + ": " + e.what());
        }
        item.estimate.resolve(referenceTriplet(report));
    }
}

} // namespace forecast
