#include "fuzzy_date.hpp"
#include "error.hpp"

#include <cctype>
#include <cstdio>
#include <cstdint>
#include <limits>
#include <boost/property_tree/ptree.hpp>
#include <boost/date_time/gregorian/gregorian_types.hpp>


_FZD_NAMESPACE_BEGIN


namespace pt = boost::property_tree;


namespace {

int compare_component(const fuzzy_date::component& a, const fuzzy_date::component& b) noexcept {
    if (!a && !b) return 0;
    if (!a) return -1;
    if (!b) return 1;
    if (*a < *b) return -1;
    if (*b < *a) return 1;
    return 0;
}


/* fixed-width decimal field [pos, pos+len) of text */
int parse_field(const std::string& text, size_t pos, size_t len) {
    int v = 0;

    for (size_t i = pos; i < pos + len; ++i) {
        const char c = text[i];

        if (!isdigit(static_cast<unsigned char>(c)))
            throw format_error("Malformed fuzzy date '%s': '%s' is not a number",
                               text.c_str(), text.substr(pos, len).c_str());

        v = v * 10 + (c - '0');
    }

    return v;
}


fuzzy_date::component read_component(const pt::ptree& tree, const char* key) {
    if (!tree.get_child_optional(key))
        return fuzzy_date::component{};

    try {
        return tree.get<int>(key);
    }
    catch (const pt::ptree_bad_data& e) {
        throw format_error("Fuzzy date field '%s' is not an integer: %s", key, e.what());
    }
}

}


fuzzy_date::fuzzy_date(component year, component month, component day, const rules_runner& rules)
    : _y(year), _m(month), _d(day), _p_rules(&rules) {

    rules.run(*this);
}


fuzzy_date::fuzzy_date() : fuzzy_date(boost::none, boost::none, boost::none, rules_runner::builtin()) {}


fuzzy_date fuzzy_date::unknown(const rules_runner& rules) {
    return fuzzy_date{ boost::none, boost::none, boost::none, rules };
}


fuzzy_date fuzzy_date::today(const rules_runner& rules) {
    const boost::gregorian::date now = boost::gregorian::day_clock::local_day();
    return fuzzy_date{ static_cast<int>(now.year()), static_cast<int>(now.month()), static_cast<int>(now.day()), rules };
}


fuzzy_date fuzzy_date::from_calendar_date(int year, int month, int day, const rules_runner& rules) {
    return fuzzy_date{ year, month, day, rules };
}


fuzzy_date fuzzy_date::from_calendar_date(const calendar_date& dt, const rules_runner& rules) {
    return fuzzy_date{ dt.year(), dt.month(), dt.day(), rules };
}


fuzzy_date fuzzy_date::from_year_month(int year, int month, const rules_runner& rules) {
    return fuzzy_date{ year, month, boost::none, rules };
}


fuzzy_date fuzzy_date::from_year(int year, const rules_runner& rules) {
    return fuzzy_date{ year, boost::none, boost::none, rules };
}


fuzzy_date fuzzy_date::parse(const std::string& text, const rules_runner& rules) {
    component y, m, d;

    if (text.size() >= 4) {
        y = parse_field(text, 0, 4);

        if (text.size() >= 7) {
            m = parse_field(text, 5, 2);

            if (text.size() == 10)
                d = parse_field(text, 8, 2);
        }
    }

    return fuzzy_date{ y, m, d, rules };
}


fuzzy_date fuzzy_date::from_ptree(const pt::ptree& tree, const rules_runner& rules) {
    return fuzzy_date{ read_component(tree, "Year"),
                       read_component(tree, "Month"),
                       read_component(tree, "Day"),
                       rules };
}


uint fuzzy_date::specificity() const noexcept {
    if (!_y) return 0;
    if (!_m) return 1;
    if (!_d) return 2;
    return 3;
}


int fuzzy_date::compare(const fuzzy_date& other) const noexcept {
    int c;

    if (( c = compare_component(_y, other._y) ) != 0)
        return c;

    if (( c = compare_component(_m, other._m) ) != 0)
        return c;

    return compare_component(_d, other._d);
}


fuzzy_date fuzzy_date::add_years(int n) const {
    if (!_y)
        return fuzzy_date{ _y, _m, _d, *_p_rules };

    const int64_t y = static_cast<int64_t>(*_y) + n;

    if (y < std::numeric_limits<int>::min() || y > std::numeric_limits<int>::max())
        throw va_error("Adding %d years to year %d overflows the year", n, *_y);

    return fuzzy_date{ static_cast<int>(y), _m, _d, *_p_rules };
}


fuzzy_date fuzzy_date::add_months(int n) const {
    if (!_m)
        return *this;

    return from_calendar_date(to_calendar_date().add_months(n), *_p_rules);
}


fuzzy_date fuzzy_date::add_days(int n) const {
    if (!_d)
        return *this;

    return from_calendar_date(to_calendar_date().add_days(n), *_p_rules);
}


bool fuzzy_date::is_leap_year() const noexcept {
    return _y && fzd::is_leap_year(*_y);
}


calendar_date fuzzy_date::to_calendar_date() const {
    const int y = (_y && *_y > 1) ? *_y : 1;
    const int m = _m ? *_m : 1;
    int d = _d ? *_d : 1;

    /* a day that only fits a leap year can meet a substituted year 1 */
    if (m >= 1 && m <= 12 && d > days_in_month(y, m))
        d = days_in_month(y, m);

    return calendar_date{ y, m, d };
}


std::string fuzzy_date::to_canonical_string() const {
    char buf[32];

    const uint spec = specificity();

    if (spec >= 1 && (*_y < 0 || *_y > 9999))
        throw format_error("Year %d has no canonical form (expected [0, 9999])", *_y);

    if (spec >= 2 && (*_m < 0 || *_m > 99))
        throw format_error("Month %d has no canonical form (expected [0, 99])", *_m);

    if (spec == 3 && (*_d < 0 || *_d > 99))
        throw format_error("Day %d has no canonical form (expected [0, 99])", *_d);

    switch (spec) {
    case 0:
        return std::string{};
    case 1:
        snprintf(&buf[0], sizeof(buf), "%04d", *_y);
        break;
    case 2:
        snprintf(&buf[0], sizeof(buf), "%04d/%02d", *_y, *_m);
        break;
    default:
        snprintf(&buf[0], sizeof(buf), "%04d/%02d/%02d", *_y, *_m, *_d);
        break;
    }

    return std::string{ &buf[0] };
}


std::string fuzzy_date::to_string() const {
    char buf[64];

    if (!_y)
        return "unknown date";

    if (!_m)
        return std::to_string(*_y);

    if (!_d) {
        snprintf(&buf[0], sizeof(buf), "%s %d", month_name(*_m), *_y);
        return std::string{ &buf[0] };
    }

    const bool on_calendar = *_y >= calendar_date::MIN_YEAR && *_y <= calendar_date::MAX_YEAR
                          && *_m >= 1 && *_m <= 12
                          && *_d >= 1 && *_d <= days_in_month(*_y, *_m);

    if (on_calendar) {
        const calendar_date dt{ *_y, *_m, *_d };
        snprintf(&buf[0], sizeof(buf), "%s, %s %d, %d", weekday_name(dt.day_of_week()), month_name(*_m), *_d, *_y);
    }
    else
        snprintf(&buf[0], sizeof(buf), "%s %d, %d", month_name(*_m), *_d, *_y);

    return std::string{ &buf[0] };
}


void fuzzy_date::to_ptree(pt::ptree* p_out) const {
    if (p_out == nullptr)
        throw null_argument_error("p_out");

    if (_y) p_out->put("Year", *_y);
    if (_m) p_out->put("Month", *_m);
    if (_d) p_out->put("Day", *_d);
}


std::ostream& operator<<(std::ostream& os, const fuzzy_date& d) {
    return os << d.to_string();
}


_FZD_NAMESPACE_END
