#include "calendar.hpp"
#include "error.hpp"

#include <iomanip>


_FZD_NAMESPACE_BEGIN


namespace {

const int DAYS_IN_MONTH[2][13] = {
    { 0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 },
    { 0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 },
};

const char* const MONTH_NAMES[13] = {
    "?", "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December",
};

const char* const WEEKDAY_NAMES[7] = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday",
};

/* the era-based civil conversions below count days from 0000-03-01 internally (so that the leap day is the last day
 * of the computational year) and shift the result to the unix epoch. */

int64_t days_from_civil(int64_t y, uint m, uint d) noexcept {
    y -= (m <= 2);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const uint yoe = static_cast<uint>(y - era * 400);                // [0, 399]
    const uint doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1; // [0, 365]
    const uint doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;           // [0, 146096]
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, uint& m, uint& d) noexcept {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const uint doe = static_cast<uint>(z - era * 146097);
    const uint yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const uint doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const uint mp  = (5 * doy + 2) / 153;

    d = doy - (153 * mp + 2) / 5 + 1;
    m = (mp < 10) ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

}


bool is_leap_year(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}


int days_in_month(int year, int month) noexcept {
    return DAYS_IN_MONTH[is_leap_year(year) ? 1 : 0][month];
}


const char* month_name(int month) noexcept {
    return (month >= 1 && month <= 12) ? MONTH_NAMES[month] : MONTH_NAMES[0];
}


const char* weekday_name(uint wday) noexcept {
    return WEEKDAY_NAMES[wday % 7];
}


const int calendar_date::MIN_YEAR;
const int calendar_date::MAX_YEAR;


void calendar_date::throw_bounds_error(const char* field, int val, int min, int max) {
    throw va_error("Calendar date %s %d is out of range [%d, %d]", field, val, min, max);
}


calendar_date::calendar_date(int year, int month, int day) : _y(year), _m(month), _d(day) {
    if (year < MIN_YEAR || year > MAX_YEAR)
        throw_bounds_error("year", year, MIN_YEAR, MAX_YEAR);

    if (month < 1 || month > 12)
        throw_bounds_error("month", month, 1, 12);

    const int max_day = days_in_month(year, month);

    if (day < 1 || day > max_day)
        throw_bounds_error("day", day, 1, max_day);
}


int64_t calendar_date::day_number() const noexcept {
    return days_from_civil(_y, static_cast<uint>(_m), static_cast<uint>(_d));
}


calendar_date calendar_date::from_day_number(int64_t n) {
    int64_t y;
    uint m, d;
    civil_from_days(n, y, m, d);

    if (y < MIN_YEAR || y > MAX_YEAR)
        throw va_error("Calendar arithmetic left the supported year range [%d, %d]", MIN_YEAR, MAX_YEAR);

    return calendar_date{ static_cast<int>(y), static_cast<int>(m), static_cast<int>(d) };
}


uint calendar_date::day_of_week() const noexcept {
    const int64_t z = day_number(); // 1970-01-01 was a Thursday
    return static_cast<uint>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}


calendar_date calendar_date::add_months(int64_t n) const {
    const int64_t total = static_cast<int64_t>(_y) * 12 + (_m - 1) + n;
    const int64_t y = (total >= 0 ? total : total - 11) / 12;
    const int m = static_cast<int>(total - y * 12) + 1;

    if (y < MIN_YEAR || y > MAX_YEAR)
        throw va_error("Calendar arithmetic left the supported year range [%d, %d]", MIN_YEAR, MAX_YEAR);

    const int max_day = days_in_month(static_cast<int>(y), m);
    return calendar_date{ static_cast<int>(y), m, (_d > max_day) ? max_day : _d };
}


std::ostream& operator<<(std::ostream& os, const calendar_date& dt) {
    const char fill = os.fill('0');
    os << std::setw(4) << dt.year() << '-'
       << std::setw(2) << dt.month() << '-'
       << std::setw(2) << dt.day();
    os.fill(fill);
    return os;
}


_FZD_NAMESPACE_END
