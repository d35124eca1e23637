// -*- c++ -*-

#pragma once
#include "config.hpp"
#include "fuzzy_date.hpp"

#include <string>
#include <ostream>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree_fwd.hpp>


_FZD_NAMESPACE_BEGIN


/* FUZZY_DATE_RANGE -- immutable [from, to] pair of fuzzy dates, validated by the same rules machinery as fuzzy_date.
 * an absent endpoint is taken to be the unknown date. */

class fuzzy_date_range {
    fuzzy_date _from;
    fuzzy_date _to;

public:
    fuzzy_date_range(const boost::optional<fuzzy_date>& from, const boost::optional<fuzzy_date>& to,
                     const rules_runner& rules = rules_runner::builtin());

    /* reads the From/To layout written by to_ptree(); a missing child is an unknown endpoint */
    static fuzzy_date_range from_ptree(const boost::property_tree::ptree& tree,
                                       const rules_runner& rules = rules_runner::builtin());

    /* the endpoints keep a pointer to the runner, so a temporary one is refused */
    fuzzy_date_range(const boost::optional<fuzzy_date>&, const boost::optional<fuzzy_date>&,
                     const rules_runner&&) = delete;
    static fuzzy_date_range from_ptree(const boost::property_tree::ptree&, const rules_runner&&) = delete;

    const fuzzy_date& from() const noexcept { return _from; }
    const fuzzy_date& to()   const noexcept { return _to; }

    /* to - from, both materialized with fuzzy_date::to_calendar_date() (and so just as lossy) */
    days to_duration() const;

    /* by from, then by to */
    int compare(const fuzzy_date_range& other) const noexcept;

    bool operator< (const fuzzy_date_range& o) const noexcept { return compare(o) <  0; }
    bool operator> (const fuzzy_date_range& o) const noexcept { return compare(o) >  0; }
    bool operator<=(const fuzzy_date_range& o) const noexcept { return compare(o) <= 0; }
    bool operator>=(const fuzzy_date_range& o) const noexcept { return compare(o) >= 0; }
    bool operator==(const fuzzy_date_range& o) const noexcept { return compare(o) == 0; }
    bool operator!=(const fuzzy_date_range& o) const noexcept { return compare(o) != 0; }

    /* for diagnostics and tests only */
    std::string to_string() const;

    void to_ptree(boost::property_tree::ptree* p_out) const;
};


std::ostream& operator<<(std::ostream&, const fuzzy_date_range&);


_FZD_NAMESPACE_END
