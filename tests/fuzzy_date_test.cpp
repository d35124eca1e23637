#include <boost/test/unit_test.hpp>
#include <boost/optional/optional_io.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/date_time/gregorian/gregorian_types.hpp>

#include "fuzzy_date.hpp"
#include "builtin_rules.hpp"
#include "error.hpp"

#include <vector>
#include <sstream>
#include <climits>
#include <type_traits>
#include <utility>

using namespace fzd;
namespace pt = boost::property_tree;


namespace {

template<class...> struct voider { typedef void type; };

/* whether from_year()/parse() can be called with a runner expression of type Runner */
template<class Runner, class = void>
struct from_year_accepts : std::false_type {};

template<class Runner>
struct from_year_accepts<Runner, typename voider<decltype(fuzzy_date::from_year(0, std::declval<Runner>()))>::type>
    : std::true_type {};

template<class Runner, class = void>
struct parse_accepts : std::false_type {};

template<class Runner>
struct parse_accepts<Runner, typename voider<decltype(fuzzy_date::parse(std::string(), std::declval<Runner>()))>::type>
    : std::true_type {};

/* a date with a month but no year; only reachable through from_ptree() */
fuzzy_date yearless(int month, boost::optional<int> day = boost::none) {
    pt::ptree tree;
    tree.put("Month", month);

    if (day)
        tree.put("Day", *day);

    return fuzzy_date::from_ptree(tree);
}

}


BOOST_AUTO_TEST_SUITE(fuzzy_date_value)

BOOST_AUTO_TEST_CASE(unknown_has_no_components) {
    const fuzzy_date d = fuzzy_date::unknown();

    BOOST_CHECK(!d.year());
    BOOST_CHECK(!d.month());
    BOOST_CHECK(!d.day());
    BOOST_CHECK_EQUAL(d.specificity(), 0u);
    BOOST_CHECK_EQUAL(fuzzy_date(), d);
}

BOOST_AUTO_TEST_CASE(factories_leave_trailing_components_absent) {
    const fuzzy_date y = fuzzy_date::from_year(2018);
    BOOST_CHECK_EQUAL(y.year(), boost::optional<int>(2018));
    BOOST_CHECK(!y.month());
    BOOST_CHECK_EQUAL(y.specificity(), 1u);

    const fuzzy_date ym = fuzzy_date::from_year_month(2019, 3);
    BOOST_CHECK_EQUAL(ym.month(), boost::optional<int>(3));
    BOOST_CHECK(!ym.day());
    BOOST_CHECK_EQUAL(ym.specificity(), 2u);

    const fuzzy_date full = fuzzy_date::from_calendar_date(calendar_date(2019, 3, 4));
    BOOST_CHECK_EQUAL(full, fuzzy_date::from_calendar_date(2019, 3, 4));
    BOOST_CHECK_EQUAL(full.day(), boost::optional<int>(4));
    BOOST_CHECK_EQUAL(full.specificity(), 3u);
}

BOOST_AUTO_TEST_CASE(today_matches_local_clock) {
    const fuzzy_date t = fuzzy_date::today();
    const boost::gregorian::date now = boost::gregorian::day_clock::local_day();

    BOOST_CHECK_EQUAL(t.specificity(), 3u);

    /* tolerate the clock rolling over midnight between the two reads */
    const fuzzy_date expected = fuzzy_date::from_calendar_date(now.year(), now.month(), now.day());
    BOOST_CHECK(t == expected || t.add_days(1) == expected);
}

BOOST_AUTO_TEST_CASE(absence_sorts_before_presence) {
    const fuzzy_date u   = fuzzy_date::unknown();
    const fuzzy_date y   = fuzzy_date::from_year(2000);
    const fuzzy_date ym  = fuzzy_date::from_year_month(2000, 1);
    const fuzzy_date ymd = fuzzy_date::from_calendar_date(2000, 1, 1);

    BOOST_CHECK(u < y);
    BOOST_CHECK(y < ym);
    BOOST_CHECK(ym < ymd);
    BOOST_CHECK(u < ymd);
    BOOST_CHECK(ymd > u);
    BOOST_CHECK_EQUAL(u.compare(y), -1);
    BOOST_CHECK_EQUAL(ymd.compare(ym), 1);
}

BOOST_AUTO_TEST_CASE(numeric_order_within_specificity) {
    BOOST_CHECK(fuzzy_date::from_year(1999) < fuzzy_date::from_year(2000));
    BOOST_CHECK(fuzzy_date::from_year_month(2000, 1) < fuzzy_date::from_year_month(2000, 2));
    BOOST_CHECK(fuzzy_date::from_calendar_date(2000, 2, 1) < fuzzy_date::from_calendar_date(2000, 2, 2));

    /* a more significant component decides before specificity does */
    BOOST_CHECK(fuzzy_date::from_calendar_date(1999, 12, 31) < fuzzy_date::from_year(2000));
    BOOST_CHECK(fuzzy_date::from_year_month(2000, 2) > fuzzy_date::from_calendar_date(2000, 1, 31));
}

BOOST_AUTO_TEST_CASE(unknown_year_still_compares_months) {
    BOOST_CHECK(yearless(3) < yearless(5));
    BOOST_CHECK(fuzzy_date::unknown() < yearless(1));
    BOOST_CHECK(yearless(12) < fuzzy_date::from_year(1));
    BOOST_CHECK(yearless(6) < yearless(6, 1));
    BOOST_CHECK_EQUAL(yearless(6, 2), yearless(6, 2));
}

BOOST_AUTO_TEST_CASE(order_is_total_and_transitive) {
    const std::vector<fuzzy_date> v = {
        fuzzy_date::unknown(),
        yearless(2),
        yearless(2, 29),
        fuzzy_date::from_year(1999),
        fuzzy_date::from_year(2000),
        fuzzy_date::from_year_month(2000, 1),
        fuzzy_date::from_year_month(2000, 12),
        fuzzy_date::from_calendar_date(2000, 1, 1),
        fuzzy_date::from_calendar_date(2000, 1, 31),
        fuzzy_date::from_calendar_date(2000, 12, 1),
        fuzzy_date::from_calendar_date(2001, 1, 1),
    };

    for (auto&& a : v) {
        for (auto&& b : v) {
            const int n = (a < b) + (a == b) + (a > b);
            BOOST_CHECK_EQUAL(n, 1);
            BOOST_CHECK_EQUAL(a.compare(b), -b.compare(a));

            for (auto&& c : v)
                if (a <= b && b <= c)
                    BOOST_CHECK(a <= c);
        }
    }
}

BOOST_AUTO_TEST_CASE(leap_years) {
    BOOST_CHECK(fuzzy_date::from_year(2000).is_leap_year());
    BOOST_CHECK(fuzzy_date::from_year(2020).is_leap_year());
    BOOST_CHECK(!fuzzy_date::from_year(1900).is_leap_year());
    BOOST_CHECK(!fuzzy_date::from_year(2019).is_leap_year());
    BOOST_CHECK(!fuzzy_date::unknown().is_leap_year());
    BOOST_CHECK(!yearless(2, 29).is_leap_year());
}

BOOST_AUTO_TEST_CASE(add_years) {
    BOOST_CHECK_EQUAL(fuzzy_date::unknown().add_years(5), fuzzy_date::unknown());
    BOOST_CHECK_EQUAL(fuzzy_date::from_year(2000).add_years(1), fuzzy_date::from_year(2001));
    BOOST_CHECK_EQUAL(fuzzy_date::from_calendar_date(2019, 3, 4).add_years(-20),
                      fuzzy_date::from_calendar_date(1999, 3, 4));
    BOOST_CHECK_EQUAL(yearless(7).add_years(3), yearless(7));

    /* month and day are left untouched, so the result must still pass the day rule */
    BOOST_CHECK_THROW(fuzzy_date::from_calendar_date(2020, 2, 29).add_years(1), validation_error);
    BOOST_CHECK_EQUAL(fuzzy_date::from_calendar_date(2020, 2, 29).add_years(4),
                      fuzzy_date::from_calendar_date(2024, 2, 29));
}

BOOST_AUTO_TEST_CASE(add_years_refuses_to_overflow) {
    BOOST_CHECK_THROW(fuzzy_date::from_year(INT_MAX).add_years(1), va_error);
    BOOST_CHECK_THROW(fuzzy_date::from_year(9999).add_years(INT_MAX), va_error);
    BOOST_CHECK_THROW(fuzzy_date::from_year(-1).add_years(INT_MIN), va_error);

    BOOST_CHECK_EQUAL(fuzzy_date::from_year(0).add_years(INT_MAX).year(), boost::optional<int>(INT_MAX));
    BOOST_CHECK_EQUAL(fuzzy_date::from_year(INT_MAX).add_years(-1).year(), boost::optional<int>(INT_MAX - 1));
    BOOST_CHECK_EQUAL(fuzzy_date::unknown().add_years(INT_MAX), fuzzy_date::unknown());
}

BOOST_AUTO_TEST_CASE(add_months) {
    const fuzzy_date y = fuzzy_date::from_year(2020);
    BOOST_CHECK_EQUAL(y.add_months(3), y);
    BOOST_CHECK_EQUAL(y.add_months(3).specificity(), 1u);
    BOOST_CHECK_EQUAL(fuzzy_date::unknown().add_months(1), fuzzy_date::unknown());

    /* the unknown day comes back as the 1st */
    const fuzzy_date next = fuzzy_date::from_year_month(2020, 12).add_months(1);
    BOOST_CHECK_EQUAL(next.year(), boost::optional<int>(2021));
    BOOST_CHECK_EQUAL(next.month(), boost::optional<int>(1));
    BOOST_CHECK_EQUAL(next, fuzzy_date::from_calendar_date(2021, 1, 1));

    BOOST_CHECK_EQUAL(fuzzy_date::from_calendar_date(2020, 1, 31).add_months(1),
                      fuzzy_date::from_calendar_date(2020, 2, 29));
    BOOST_CHECK_EQUAL(fuzzy_date::from_year_month(2021, 1).add_months(-1),
                      fuzzy_date::from_calendar_date(2020, 12, 1));

    /* and so does the unknown year */
    BOOST_CHECK_EQUAL(yearless(6).add_months(1), fuzzy_date::from_calendar_date(1, 7, 1));
}

BOOST_AUTO_TEST_CASE(add_days) {
    const fuzzy_date ym = fuzzy_date::from_year_month(2020, 2);
    BOOST_CHECK_EQUAL(ym.add_days(10), ym);
    BOOST_CHECK_EQUAL(ym.add_days(10).specificity(), 2u);

    BOOST_CHECK_EQUAL(fuzzy_date::from_calendar_date(2020, 2, 28).add_days(1),
                      fuzzy_date::from_calendar_date(2020, 2, 29));
    BOOST_CHECK_EQUAL(fuzzy_date::from_calendar_date(2020, 12, 31).add_days(1),
                      fuzzy_date::from_calendar_date(2021, 1, 1));
    BOOST_CHECK_EQUAL(fuzzy_date::from_calendar_date(2021, 3, 1).add_days(-1),
                      fuzzy_date::from_calendar_date(2021, 2, 28));
}

BOOST_AUTO_TEST_CASE(derived_values_keep_their_runner) {
    const rules_runner none;
    const fuzzy_date d = fuzzy_date::from_year(2000, none).add_years(1);
    BOOST_CHECK_EQUAL(&d.rules(), &none);
    BOOST_CHECK_EQUAL(&fuzzy_date::from_year(2000).rules(), &rules_runner::builtin());

    /* the permissive runner lets an out-of-range month through add_years() */
    const fuzzy_date odd = fuzzy_date::from_year_month(2000, 13, none).add_years(1);
    BOOST_CHECK_EQUAL(odd.month(), boost::optional<int>(13));
}

BOOST_AUTO_TEST_CASE(temporary_runner_is_refused) {
    BOOST_CHECK(from_year_accepts<const rules_runner&>::value);
    BOOST_CHECK(from_year_accepts<rules_runner&>::value);
    BOOST_CHECK(!from_year_accepts<rules_runner>::value);
    BOOST_CHECK(!from_year_accepts<const rules_runner>::value);

    BOOST_CHECK(parse_accepts<const rules_runner&>::value);
    BOOST_CHECK(!parse_accepts<rules_runner&&>::value);
}

BOOST_AUTO_TEST_CASE(calendar_materialization) {
    BOOST_CHECK_EQUAL(fuzzy_date::unknown().to_calendar_date(), calendar_date(1, 1, 1));
    BOOST_CHECK_EQUAL(fuzzy_date::from_year(2019).to_calendar_date(), calendar_date(2019, 1, 1));
    BOOST_CHECK_EQUAL(fuzzy_date::from_year_month(2019, 5).to_calendar_date(), calendar_date(2019, 5, 1));
    BOOST_CHECK_EQUAL(fuzzy_date::from_year(0).to_calendar_date(), calendar_date(1, 1, 1));
    BOOST_CHECK_EQUAL(fuzzy_date::from_year(-44).to_calendar_date(), calendar_date(1, 1, 1));
    BOOST_CHECK_EQUAL(yearless(2, 29).to_calendar_date(), calendar_date(1, 2, 28));
}

BOOST_AUTO_TEST_CASE(display) {
    BOOST_CHECK_EQUAL(fuzzy_date::unknown().to_string(), "unknown date");
    BOOST_CHECK_EQUAL(fuzzy_date::from_year(2019).to_string(), "2019");
    BOOST_CHECK_EQUAL(fuzzy_date::from_year_month(2019, 3).to_string(), "March 2019");
    BOOST_CHECK_EQUAL(fuzzy_date::from_calendar_date(2019, 3, 4).to_string(), "Monday, March 4, 2019");

    std::ostringstream os;
    os << fuzzy_date::from_year_month(2018, 12);
    BOOST_CHECK_EQUAL(os.str(), "December 2018");
}

BOOST_AUTO_TEST_SUITE_END()
