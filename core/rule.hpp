// -*- c++ -*-

#pragma once
#include "config.hpp"
#include "error_queue.hpp"


_FZD_NAMESPACE_BEGIN


class fuzzy_date;
class fuzzy_date_range;


/* RULE -- one independently testable constraint over a freshly constructed value.
 *
 * a rule targets exactly one entity kind. it accepts a candidate by doing nothing and rejects it by enqueuing at least
 * one error. rules must be deterministic and may only look at the candidate's public accessors. */

enum class rule_target : uint8_t {
    DATE,
    RANGE
};

template<class T> struct rule_target_of;
template<> struct rule_target_of<fuzzy_date>       { static constexpr rule_target value = rule_target::DATE; };
template<> struct rule_target_of<fuzzy_date_range> { static constexpr rule_target value = rule_target::RANGE; };


class rule {
public:
    virtual ~rule() {}

    virtual const char* name() const noexcept = 0; // must have static lifetime
    virtual rule_target target() const noexcept = 0;
};


template<class T>
class basic_rule : public rule {
public:
    rule_target target() const noexcept final { return rule_target_of<T>::value; }

    virtual void check(const T& candidate, error_queue& errq) const = 0;
};


typedef basic_rule<fuzzy_date>       date_rule;
typedef basic_rule<fuzzy_date_range> range_rule;


_FZD_NAMESPACE_END
