#include "forecast/calendar.hpp"
#include "forecast/errors.hpp"
#include <algorithm>
#include <cmath>

namespace forecast {

FreeDateRange::FreeDateRange(const Date& start, const Date& end)
    : startDate(start), endDate(end) {
    if (!start.isValid() || !end.isValid()) {
        throw InputError("free date range requires both start_date and end_date");
    }
    if (end < start) {
        throw InputError("invalid free date range: start_date " + start.toString() +
                         " is after end_date " + end.toString());
    }
}

Calendar::Calendar(std::vector<Weekday> free_weekdays, std::vector<FreeDateRange> free_date_ranges)
    : free_weekdays_(std::move(free_weekdays))
    , free_date_ranges_(std::move(free_date_ranges)) {}

double Calendar::getCapacity(const Date& date) const {
    Weekday day = date.weekday();
    if (std::find(free_weekdays_.begin(), free_weekdays_.end(), day) != free_weekdays_.end()) {
        return 0.0;
    }
    for (const auto& range : free_date_ranges_) {
        if (range.contains(date)) {
            return 0.0;
        }
    }
    return 1.0;
}

TeamCalendar::TeamCalendar(std::vector<Calendar> calendars)
    : calendars_(std::move(calendars)) {}

double TeamCalendar::getCapacity(const Date& date) const {
    if (calendars_.empty()) {
        return getDefaultCapacity(date);
    }
    double capacity_sum = 0.0;
    for (const auto& calendar : calendars_) {
        capacity_sum += calendar.getCapacity(date);
    }
    return capacity_sum / static_cast<double>(calendars_.size());
}

double TeamCalendar::getDefaultCapacity(const Date& date) {
    Weekday day = date.weekday();
    if (day == Weekday::SATURDAY || day == Weekday::SUNDAY) {
        return 0.0;
    }
    return 1.0;
}

double TeamCalendar::summedCapacity(const Date& start, const Date& end) const {
    double total = 0.0;
    for (Date current = start; current <= end; current = current.next()) {
        total += getCapacity(current);
    }
    return total;
}

constexpr std::int64_t CapacityTimeline::MAX_HORIZON_DAYS;

CapacityTimeline::CapacityTimeline(const TeamCalendar& calendar, const Date& origin)
    : calendar_(calendar), origin_(origin) {
    if (!origin.isValid()) {
        throw std::invalid_argument("Capacity timeline requires a valid origin date");
    }
}

double CapacityTimeline::capacityAt(std::int64_t day_offset) {
    if (day_offset < 0) {
        throw std::out_of_range("Negative day offset");
    }
    size_t index = static_cast<size_t>(day_offset);
    while (capacities_.size() <= index) {
        Date date = origin_.addDays(static_cast<std::int64_t>(capacities_.size()));
        capacities_.push_back(std::max(0.0, calendar_.getCapacity(date)));
    }
    return capacities_[index];
}

double CapacityTimeline::finishOffset(double ready, double work) {
    if (ready < 0.0 || work < 0.0) {
        throw std::invalid_argument("Ready time and work must be non-negative");
    }
    if (work == 0.0) {
        return ready;
    }

    std::int64_t day = static_cast<std::int64_t>(std::floor(ready));
    double used = ready - static_cast<double>(day);
    const std::int64_t limit = day + MAX_HORIZON_DAYS;
    double remaining = work;

    while (day < limit) {
        double capacity = capacityAt(day);
        if (capacity > 0.0) {
            double available = capacity * (1.0 - used);
            if (remaining <= available) {
                return static_cast<double>(day) + used + remaining / capacity;
            }
            remaining -= available;
        }
        ++day;
        used = 0.0;
    }

    throw InputError("team calendar has no capacity within " +
                     std::to_string(MAX_HORIZON_DAYS) + " days after " +
                     origin_.addDays(static_cast<std::int64_t>(std::floor(ready))).toString());
}

} // namespace forecast
