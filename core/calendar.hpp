/* fzd::calendar_date -- a fully specified date in the proleptic Gregorian calendar, plus the handful of calendar
 * computations fuzzy_date needs (leap years, month lengths, day/month arithmetic).
 *
 * supported years are [1, 9999]. arithmetic that leaves that window throws va_error.
 */

#pragma once
#include "config.hpp"

#include <chrono>
#include <ratio>
#include <ostream>


_FZD_NAMESPACE_BEGIN


typedef std::chrono::duration<int64_t, std::ratio<86400>> days;

bool is_leap_year(int year) noexcept;
int  days_in_month(int year, int month) noexcept; // month must be in [1,12]
const char* month_name(int month) noexcept;       // "January" .. "December", or "?" if out of range
const char* weekday_name(uint wday) noexcept;     // 0 = "Sunday"


class calendar_date {
    int _y;
    int _m;
    int _d;

    [[noreturn]] static void throw_bounds_error(const char* field, int val, int min, int max);

public:
    static const int MIN_YEAR = 1;
    static const int MAX_YEAR = 9999;

    calendar_date(int year, int month, int day);

    int year()  const noexcept { return _y; }
    int month() const noexcept { return _m; }
    int day()   const noexcept { return _d; }

    /* days relative to 1970-01-01 */
    int64_t day_number() const noexcept;
    static calendar_date from_day_number(int64_t n);

    uint day_of_week() const noexcept; // 0 = Sunday

    calendar_date add_days(int64_t n) const { return from_day_number(day_number() + n); }

    /* day-of-month is clamped to the length of the target month (Jan 31 + 1 month = Feb 28/29) */
    calendar_date add_months(int64_t n) const;

    bool operator< (const calendar_date& o) const noexcept { return day_number() <  o.day_number(); }
    bool operator==(const calendar_date& o) const noexcept { return _y == o._y && _m == o._m && _d == o._d; }
    bool operator!=(const calendar_date& o) const noexcept { return !(*this == o); }
};


inline days operator-(const calendar_date& a, const calendar_date& b) noexcept {
    return days{ a.day_number() - b.day_number() };
}


std::ostream& operator<<(std::ostream&, const calendar_date&); // YYYY-MM-DD


_FZD_NAMESPACE_END
