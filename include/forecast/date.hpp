#ifndef FORECAST_DATE_HPP
#define FORECAST_DATE_HPP

#include <cstdint>
#include <string>

namespace forecast {

enum class Weekday {
    MONDAY,
    TUESDAY,
    WEDNESDAY,
    THURSDAY,
    FRIDAY,
    SATURDAY,
    SUNDAY
};

// Accepts "Mon" or "Monday" in any letter case. Throws InputError otherwise.
Weekday parseWeekday(const std::string& text);

// Proleptic Gregorian calendar date with day resolution.
// A default-constructed Date is invalid and stands for "not set".
class Date {
public:
    Date() = default;
    Date(int year, unsigned month, unsigned day);

    // Strict YYYY-MM-DD. Throws InputError on malformed or impossible dates.
    static Date parse(const std::string& text);

    bool isValid() const { return valid_; }

    int year() const;
    unsigned month() const;
    unsigned day() const;
    Weekday weekday() const;

    Date addDays(std::int64_t count) const;
    Date next() const { return addDays(1); }
    std::int64_t daysUntil(const Date& other) const { return other.days_ - days_; }

    std::string toString() const;

    bool operator==(const Date& other) const {
        return valid_ == other.valid_ && days_ == other.days_;
    }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const { return days_ < other.days_; }
    bool operator<=(const Date& other) const { return days_ <= other.days_; }
    bool operator>(const Date& other) const { return days_ > other.days_; }
    bool operator>=(const Date& other) const { return days_ >= other.days_; }

private:
    explicit Date(std::int64_t day_number) : days_(day_number), valid_(true) {}

    void require_valid() const;

    std::int64_t days_ = 0;
    bool valid_ = false;
};

} // namespace forecast

#endif // FORECAST_DATE_HPP
