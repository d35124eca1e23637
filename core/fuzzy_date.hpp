// -*- c++ -*-

#pragma once
#include "config.hpp"
#include "calendar.hpp"
#include "rules_runner.hpp"

#include <string>
#include <ostream>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree_fwd.hpp>


_FZD_NAMESPACE_BEGIN


/* FUZZY_DATE -- a proleptic Gregorian date whose year, month and/or day may be unknown.
 *
 * values are immutable. every way of making one (factories, parse, the add_* family) goes through a single private
 * constructor which runs the candidate through a rules_runner; a rejected candidate never comes into existence.
 *
 * ordering: year, then month, then day. at each level an absent component sorts before a present one, so for a
 * fixed prefix unknown < year-only < year+month < full date. */

class fuzzy_date {
public:
    typedef boost::optional<int> component;

private:
    component _y;
    component _m;
    component _d;
    const rules_runner* _p_rules; // never null

    fuzzy_date(component year, component month, component day, const rules_runner& rules);

public:
    /* equivalent to unknown() against the built-in rules */
    fuzzy_date();

    static fuzzy_date unknown(const rules_runner& rules = rules_runner::builtin());
    static fuzzy_date today(const rules_runner& rules = rules_runner::builtin());

    static fuzzy_date from_calendar_date(int year, int month, int day,
                                         const rules_runner& rules = rules_runner::builtin());
    static fuzzy_date from_calendar_date(const calendar_date& dt,
                                         const rules_runner& rules = rules_runner::builtin());
    static fuzzy_date from_year_month(int year, int month,
                                      const rules_runner& rules = rules_runner::builtin());
    static fuzzy_date from_year(int year, const rules_runner& rules = rules_runner::builtin());

    /* accepts exactly "YYYY", "YYYY/MM" and "YYYY/MM/DD", keyed on length alone (separators are not inspected).
     * text shorter than 4 characters yields an unknown date. throws format_error if an extracted field is not made
     * of digits. */
    static fuzzy_date parse(const std::string& text, const rules_runner& rules = rules_runner::builtin());

    /* reads the Year/Month/Day layout written by to_ptree(); missing fields are unknown */
    static fuzzy_date from_ptree(const boost::property_tree::ptree& tree,
                                 const rules_runner& rules = rules_runner::builtin());

    /* values keep a pointer to their runner, so a temporary one is refused at compile time */
    static fuzzy_date unknown(const rules_runner&&) = delete;
    static fuzzy_date today(const rules_runner&&) = delete;
    static fuzzy_date from_calendar_date(int, int, int, const rules_runner&&) = delete;
    static fuzzy_date from_calendar_date(const calendar_date&, const rules_runner&&) = delete;
    static fuzzy_date from_year_month(int, int, const rules_runner&&) = delete;
    static fuzzy_date from_year(int, const rules_runner&&) = delete;
    static fuzzy_date parse(const std::string&, const rules_runner&&) = delete;
    static fuzzy_date from_ptree(const boost::property_tree::ptree&, const rules_runner&&) = delete;

    const component& year()  const noexcept { return _y; }
    const component& month() const noexcept { return _m; }
    const component& day()   const noexcept { return _d; }

    /* number of leading components that are known: 0 (unknown) .. 3 (full date) */
    uint specificity() const noexcept;

    const rules_runner& rules() const noexcept { return *_p_rules; }

    /* <0, 0, >0. the validating runner does not take part in comparison. */
    int compare(const fuzzy_date& other) const noexcept;

    bool operator< (const fuzzy_date& o) const noexcept { return compare(o) <  0; }
    bool operator> (const fuzzy_date& o) const noexcept { return compare(o) >  0; }
    bool operator<=(const fuzzy_date& o) const noexcept { return compare(o) <= 0; }
    bool operator>=(const fuzzy_date& o) const noexcept { return compare(o) >= 0; }
    bool operator==(const fuzzy_date& o) const noexcept { return compare(o) == 0; }
    bool operator!=(const fuzzy_date& o) const noexcept { return compare(o) != 0; }

    /* throws va_error if the resulting year does not fit in an int */
    fuzzy_date add_years(int n) const;

    /* when the month (resp. day) is known, these go through to_calendar_date(), so an unknown year or day comes back
     * populated as 1. otherwise they return an unchanged copy. */
    fuzzy_date add_months(int n) const;
    fuzzy_date add_days(int n) const;

    bool is_leap_year() const noexcept;

    /* lossy: unknown components become 1, the year is floored at 1, and the day is clamped to the month's length */
    calendar_date to_calendar_date() const;

    /* "", "YYYY", "YYYY/MM" or "YYYY/MM/DD"; parse() reads it back. throws format_error for a year outside
     * [0, 9999] or a month/day outside [0, 99], which the fixed-width form cannot hold. */
    std::string to_canonical_string() const;

    /* for diagnostics and tests only; real consumers should bring their own display adapter */
    std::string to_string() const;

    void to_ptree(boost::property_tree::ptree* p_out) const;
};


std::ostream& operator<<(std::ostream&, const fuzzy_date&);


_FZD_NAMESPACE_END
