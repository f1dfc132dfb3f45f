#include "forecast/date.hpp"
#include "forecast/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace forecast {

namespace {

// Civil date <-> day count conversions after H. Hinnant's chrono algorithms.
std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe) + static_cast<int>(era) * 400 + (m <= 2);
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned last_day_of_month(int y, unsigned m) {
    static const unsigned days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : days[m - 1];
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

Weekday parseWeekday(const std::string& text) {
    const std::string value = to_lower(text);
    if (value == "mon" || value == "monday") return Weekday::MONDAY;
    if (value == "tue" || value == "tuesday") return Weekday::TUESDAY;
    if (value == "wed" || value == "wednesday") return Weekday::WEDNESDAY;
    if (value == "thu" || value == "thursday") return Weekday::THURSDAY;
    if (value == "fri" || value == "friday") return Weekday::FRIDAY;
    if (value == "sat" || value == "saturday") return Weekday::SATURDAY;
    if (value == "sun" || value == "sunday") return Weekday::SUNDAY;
    throw InputError("invalid weekday value: " + text);
}

Date::Date(int year, unsigned month, unsigned day) {
    if (month < 1 || month > 12 || day < 1 || day > last_day_of_month(year, month)) {
        throw InputError("invalid date: " + std::to_string(year) + "-" +
                         std::to_string(month) + "-" + std::to_string(day));
    }
    days_ = days_from_civil(year, month, day);
    valid_ = true;
}

Date Date::parse(const std::string& text) {
    // YYYY-MM-DD, digits only apart from the two separators
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw InputError("invalid date format: " + text + " (expected YYYY-MM-DD)");
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw InputError("invalid date format: " + text + " (expected YYYY-MM-DD)");
        }
    }

    const int year = std::stoi(text.substr(0, 4));
    const unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    const unsigned day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
    if (month < 1 || month > 12 || day < 1 || day > last_day_of_month(year, month)) {
        throw InputError("invalid date: " + text);
    }
    return Date(year, month, day);
}

int Date::year() const {
    require_valid();
    int y; unsigned m, d;
    civil_from_days(days_, y, m, d);
    return y;
}

unsigned Date::month() const {
    require_valid();
    int y; unsigned m, d;
    civil_from_days(days_, y, m, d);
    return m;
}

unsigned Date::day() const {
    require_valid();
    int y; unsigned m, d;
    civil_from_days(days_, y, m, d);
    return d;
}

Weekday Date::weekday() const {
    require_valid();
    // 1970-01-01 was a Thursday
    const std::int64_t index = ((days_ % 7) + 7 + 3) % 7;
    return static_cast<Weekday>(index);
}

Date Date::addDays(std::int64_t count) const {
    require_valid();
    return Date(days_ + count);
}

std::string Date::toString() const {
    require_valid();
    int y; unsigned m, d;
    civil_from_days(days_, y, m, d);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", y, m, d);
    return buffer;
}

void Date::require_valid() const {
    if (!valid_) {
        throw std::logic_error("Date is not set");
    }
}

} // namespace forecast
