#ifndef FORECAST_THROUGHPUT_SIMULATION_HPP
#define FORECAST_THROUGHPUT_SIMULATION_HPP

#include "forecast/calendar.hpp"
#include "forecast/date.hpp"
#include "forecast/random.hpp"
#include "forecast/report.hpp"
#include <vector>

namespace forecast {

// Issues finished on one historical day.
struct ThroughputRecord {
    Date date;
    size_t completedIssues = 0;
};

// Next Monday-to-Friday date on or after `date`.
Date nextWorkday(const Date& date);

// Workday reached after ceil(days) workdays counted from the first workday
// on or after start_date (day 1 is that first workday).
Date workdayFromDays(const Date& start_date, double days);

/**
 * Replays historical daily throughput until `number_of_issues` are done.
 *
 * Each trial walks workdays from start_date, draws a random historical day,
 * scales its count by the calendar capacity of the current date and stops
 * once the accumulated count reaches `number_of_issues`. The trial result is
 * the number of workdays used. No per-item percentiles are produced.
 *
 * @throws ConfigurationError for zero iterations or issues, empty history or a
 *         history without any completed issue.
 * @throws InputError when the calendar offers no capacity for too long.
 */
SimulationOutput simulateThroughput(const std::vector<ThroughputRecord>& throughput,
                                    size_t iterations,
                                    size_t number_of_issues,
                                    const Date& start_date,
                                    const TeamCalendar& calendar,
                                    RandomGenerator& generator);

} // namespace forecast

#endif // FORECAST_THROUGHPUT_SIMULATION_HPP
