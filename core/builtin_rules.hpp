// -*- c++ -*-

#pragma once
#include "config.hpp"
#include "rule.hpp"
#include "rules_runner.hpp"


_FZD_NAMESPACE_BEGIN


/* month, when present, lies in [1, 12] */
class month_must_be_in_range : public date_rule {
public:
    const char* name() const noexcept override { return "month_must_be_in_range"; }
    void check(const fuzzy_date&, error_queue&) const override;
};


/* day, when present, lies in [1, N]. N is the month's length when the month is known (leap-year February when the
 * year is not), otherwise 31. */
class day_must_be_in_range : public date_rule {
public:
    const char* name() const noexcept override { return "day_must_be_in_range"; }
    void check(const fuzzy_date&, error_queue&) const override;
};


/* a day requires a month, and a month requires a year */
class components_must_be_hierarchical : public date_rule {
public:
    const char* name() const noexcept override { return "components_must_be_hierarchical"; }
    void check(const fuzzy_date&, error_queue&) const override;
};


/* once both endpoints are fully specified, the end may not precede the start */
class range_must_not_be_inverted : public range_rule {
public:
    const char* name() const noexcept override { return "range_must_not_be_inverted"; }
    void check(const fuzzy_date_range&, error_queue&) const override;
};


struct rules_options {
    bool strict_hierarchy       = false; // register components_must_be_hierarchical
    bool forbid_inverted_ranges = true;  // register range_must_not_be_inverted
};


rules_runner::vec_t make_builtin_rules(const rules_options& opts = rules_options{});


_FZD_NAMESPACE_END
