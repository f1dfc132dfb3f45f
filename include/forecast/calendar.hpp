#ifndef FORECAST_CALENDAR_HPP
#define FORECAST_CALENDAR_HPP

#include "forecast/date.hpp"
#include <vector>

namespace forecast {

// Inclusive on both ends.
struct FreeDateRange {
    Date startDate;
    Date endDate;

    FreeDateRange(const Date& start, const Date& end);

    bool contains(const Date& date) const {
        return date >= startDate && date <= endDate;
    }
};

// Availability of one person or sub-team: either fully available (1.0) or free (0.0).
class Calendar {
public:
    Calendar() = default;
    Calendar(std::vector<Weekday> free_weekdays, std::vector<FreeDateRange> free_date_ranges);

    double getCapacity(const Date& date) const;

private:
    std::vector<Weekday> free_weekdays_;
    std::vector<FreeDateRange> free_date_ranges_;
};

// Team capacity is the mean of its member calendars. Without members the
// default policy applies: weekdays 1.0, Saturday and Sunday 0.0.
class TeamCalendar {
public:
    TeamCalendar() = default;
    explicit TeamCalendar(std::vector<Calendar> calendars);

    double getCapacity(const Date& date) const;
    static double getDefaultCapacity(const Date& date);

    // Sum of capacities over [start, end]; 0 when end < start.
    double summedCapacity(const Date& start, const Date& end) const;

    void addCalendar(const Calendar& calendar) { calendars_.push_back(calendar); }

private:
    std::vector<Calendar> calendars_;
};

// Converts capacity-weighted work into elapsed calendar time from a fixed origin.
// Capacities are cached per day offset, so an instance must not be shared between threads.
class CapacityTimeline {
public:
    // Horizon after which a calendar without capacity is reported as an error.
    static constexpr std::int64_t MAX_HORIZON_DAYS = 36525;

    CapacityTimeline(const TeamCalendar& calendar, const Date& origin);

    double capacityAt(std::int64_t day_offset);

    // Fractional calendar-day offset at which `work` work-days started at
    // offset `ready` are complete.
    double finishOffset(double ready, double work);

private:
    const TeamCalendar& calendar_;
    Date origin_;
    std::vector<double> capacities_;
};

} // namespace forecast

#endif // FORECAST_CALENDAR_HPP
