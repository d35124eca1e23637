#include "builtin_rules.hpp"
#include "fuzzy_date.hpp"
#include "fuzzy_date_range.hpp"
#include "calendar.hpp"


_FZD_NAMESPACE_BEGIN


void month_must_be_in_range::check(const fuzzy_date& d, error_queue& errq) const {
    if (!d.month())
        return;

    const int m = *d.month();

    if (m < 1 || m > 12)
        errq.enqueue(name(), "Month %d is out of range [1, 12]", m);
}


void day_must_be_in_range::check(const fuzzy_date& d, error_queue& errq) const {
    if (!d.day())
        return;

    int max_day = 31;

    if (d.month() && *d.month() >= 1 && *d.month() <= 12) {
        /* an unknown year could still be a leap year */
        const int y = d.year() ? *d.year() : 2000;
        max_day = days_in_month(y, *d.month());
    }

    const int day = *d.day();

    if (day < 1 || day > max_day)
        errq.enqueue(name(), "Day %d is out of range [1, %d]", day, max_day);
}


void components_must_be_hierarchical::check(const fuzzy_date& d, error_queue& errq) const {
    if (d.day() && !d.month())
        errq.enqueue(name(), "Day %d is set without a month", *d.day());
    else if (d.month() && !d.year())
        errq.enqueue(name(), "Month %d is set without a year", *d.month());
}


void range_must_not_be_inverted::check(const fuzzy_date_range& r, error_queue& errq) const {
    if (r.from().specificity() < 3 || r.to().specificity() < 3)
        return;

    /* not to_canonical_string(): that throws past year 9999 */
    if (r.to() < r.from())
        errq.enqueue(name(), "Range end %04d/%02d/%02d precedes range start %04d/%02d/%02d",
                     *r.to().year(), *r.to().month(), *r.to().day(),
                     *r.from().year(), *r.from().month(), *r.from().day());
}


rules_runner::vec_t make_builtin_rules(const rules_options& opts) {
    rules_runner::vec_t rules;

    rules.emplace_back(std::make_unique<month_must_be_in_range>());
    rules.emplace_back(std::make_unique<day_must_be_in_range>());

    if (opts.strict_hierarchy)
        rules.emplace_back(std::make_unique<components_must_be_hierarchical>());

    if (opts.forbid_inverted_ranges)
        rules.emplace_back(std::make_unique<range_must_not_be_inverted>());

    return rules;
}


_FZD_NAMESPACE_END
