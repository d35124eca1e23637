// -*- c++ -*-

#pragma once
#include "config.hpp"
#include "rule.hpp"

#include <vector>
#include <memory>


_FZD_NAMESPACE_BEGIN


/* RULES_RUNNER -- ordered, immutable collection of rules that every fuzzy_date and fuzzy_date_range is validated
 * against at construction time.
 *
 * the rule set is fixed when the runner is constructed, so one runner may be shared by any number of threads. values
 * remember the runner that validated them; a runner must therefore outlive every value built against it. */

class rules_runner {
public:
    typedef std::vector<std::unique_ptr<const rule>> vec_t;

private:
    vec_t _rules;

    template<class T>
    void run_rules(const T& candidate) const;

public:
    rules_runner() {}
    explicit rules_runner(vec_t rules) : _rules(std::move(rules)) {}

    rules_runner(const rules_runner&) = delete;
    rules_runner& operator=(const rules_runner&) = delete;

    /* process-wide runner holding the default rule set (see make_builtin_rules()), built on first use */
    static const rules_runner& builtin();

    /* throws validation_error for the first rule (in registration order) that rejects the candidate */
    void run(const fuzzy_date& candidate) const;
    void run(const fuzzy_date_range& candidate) const;

    vec_t::size_type      size() const  { return _rules.size(); }
    bool                  empty() const { return size() == 0; }
    vec_t::const_iterator begin() const { return _rules.cbegin(); }
    vec_t::const_iterator end() const   { return _rules.cend(); }
};


_FZD_NAMESPACE_END
