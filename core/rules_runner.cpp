#include "rules_runner.hpp"
#include "builtin_rules.hpp"
#include "fuzzy_date.hpp"
#include "fuzzy_date_range.hpp"
#include "error.hpp"


_FZD_NAMESPACE_BEGIN


const rules_runner& rules_runner::builtin() {
    static const rules_runner runner{ make_builtin_rules() };
    return runner;
}


template<class T>
void rules_runner::run_rules(const T& candidate) const {
    error_queue errq;

    for (auto&& p_rule : _rules) {
        if (p_rule->target() != rule_target_of<T>::value)
            continue;

        /* target() is fixed by basic_rule<T>, so the tag guarantees the dynamic type */
        static_cast<const basic_rule<T>&>(*p_rule).check(candidate, errq);

        if (!errq.empty())
            throw validation_error(errq.front().rule(), errq.front().msg());
    }
}


void rules_runner::run(const fuzzy_date& candidate) const       { run_rules(candidate); }
void rules_runner::run(const fuzzy_date_range& candidate) const { run_rules(candidate); }


_FZD_NAMESPACE_END
