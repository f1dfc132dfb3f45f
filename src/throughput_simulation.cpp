#include "forecast/throughput_simulation.hpp"
#include "forecast/errors.hpp"
#include "forecast/statistics.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace forecast {

namespace {

bool is_weekend(const Date& date) {
    Weekday day = date.weekday();
    return day == Weekday::SATURDAY || day == Weekday::SUNDAY;
}

size_t simulate_single_run(const std::vector<size_t>& throughput_values,
                           size_t number_of_issues,
                           const Date& start_date,
                           const TeamCalendar& calendar,
                           RandomGenerator& generator) {
    const double target = static_cast<double>(number_of_issues);
    double completed = 0.0;
    size_t days = 0;
    Date date = nextWorkday(start_date);
    const Date horizon = start_date.addDays(CapacityTimeline::MAX_HORIZON_DAYS);

    while (completed < target) {
        if (date > horizon) {
            throw InputError("team calendar has no capacity within " +
                             std::to_string(CapacityTimeline::MAX_HORIZON_DAYS) +
                             " days after " + start_date.toString());
        }
        ++days;
        size_t sampled = throughput_values[generator.generateIndex(throughput_values.size())];
        double capacity = std::max(0.0, calendar.getCapacity(date));
        completed += static_cast<double>(sampled) * capacity;
        if (completed >= target) {
            break;
        }
        date = nextWorkday(date.next());
    }
    return days;
}

} // namespace

Date nextWorkday(const Date& date) {
    Date current = date;
    while (is_weekend(current)) {
        current = current.next();
    }
    return current;
}

Date workdayFromDays(const Date& start_date, double days) {
    size_t count = static_cast<size_t>(std::max(0.0, std::ceil(days)));
    Date date = nextWorkday(start_date);
    for (size_t i = 1; i < count; ++i) {
        date = nextWorkday(date.next());
    }
    return date;
}

SimulationOutput simulateThroughput(const std::vector<ThroughputRecord>& throughput,
                                    size_t iterations,
                                    size_t number_of_issues,
                                    const Date& start_date,
                                    const TeamCalendar& calendar,
                                    RandomGenerator& generator) {
    auto start_time = std::chrono::steady_clock::now();
    if (iterations == 0) {
        throw ConfigurationError("iterations must be greater than zero");
    }
    if (number_of_issues == 0) {
        throw ConfigurationError("number of issues must be greater than zero");
    }
    if (throughput.empty()) {
        throw ConfigurationError("throughput data is empty");
    }
    if (!start_date.isValid()) {
        throw InputError("invalid start date");
    }

    std::vector<size_t> throughput_values;
    throughput_values.reserve(throughput.size());
    for (const auto& record : throughput) {
        throughput_values.push_back(record.completedIssues);
    }
    if (std::all_of(throughput_values.begin(), throughput_values.end(),
                    [](size_t value) { return value == 0; })) {
        throw ConfigurationError("throughput data has no nonzero values");
    }

    SimulationOutput output;
    output.results.reserve(iterations);
    for (size_t i = 0; i < iterations; ++i) {
        size_t days = simulate_single_run(throughput_values, number_of_issues, start_date,
                                          calendar, generator);
        output.results.push_back(static_cast<double>(days));
    }
    std::sort(output.results.begin(), output.results.end());

    PercentileSummary<double> summary = StatisticalAnalysis<double>::summarizeSorted(output.results);
    SimulationReport& report = output.report;
    report.startDate = start_date.toString();
    report.iterations = iterations;
    report.simulatedItems = number_of_issues;
    report.p0.days = summary.p0;
    report.p0.date = workdayFromDays(start_date, summary.p0).toString();
    report.p50.days = summary.p50;
    report.p50.date = workdayFromDays(start_date, summary.p50).toString();
    report.p85.days = summary.p85;
    report.p85.date = workdayFromDays(start_date, summary.p85).toString();
    report.p100.days = summary.p100;
    report.p100.date = workdayFromDays(start_date, summary.p100).toString();

    output.hasWorkPackages = false;
    output.mean = StatisticalAnalysis<double>::mean(output.results);
    output.standardDeviation = StatisticalAnalysis<double>::standardDeviation(output.results);
    output.startTime = start_time;
    output.endTime = std::chrono::steady_clock::now();
    return output;
}

} // namespace forecast
