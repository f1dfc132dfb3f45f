#ifndef FORECAST_VELOCITY_HPP
#define FORECAST_VELOCITY_HPP

#include "forecast/calendar.hpp"
#include "forecast/project.hpp"

namespace forecast {

class VelocityCalculator {
public:
    // Only the most recently finished items contribute.
    static constexpr size_t MAX_COMPLETED_ITEMS = 30;

    /**
     * @brief Story points per unit of team capacity.
     *
     * Uses the Done items that carry a story-point estimate and both a start
     * and a done date, keeps the latest MAX_COMPLETED_ITEMS by done date, and
     * divides their points by the calendar capacity summed over the period
     * from the earliest start to the latest done date (inclusive).
     *
     * @throws VelocityError when no item qualifies, or the summed capacity or
     *         the resulting velocity is not positive.
     */
    static double calculate(const Project& project, const TeamCalendar& calendar);
};

} // namespace forecast

#endif // FORECAST_VELOCITY_HPP
