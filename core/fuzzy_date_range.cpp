#include "fuzzy_date_range.hpp"
#include "error.hpp"

#include <boost/property_tree/ptree.hpp>


_FZD_NAMESPACE_BEGIN


namespace pt = boost::property_tree;


fuzzy_date_range::fuzzy_date_range(const boost::optional<fuzzy_date>& from, const boost::optional<fuzzy_date>& to,
                                   const rules_runner& rules)
    : _from(from ? *from : fuzzy_date::unknown(rules)),
      _to(to ? *to : fuzzy_date::unknown(rules)) {

    rules.run(*this);
}


fuzzy_date_range fuzzy_date_range::from_ptree(const pt::ptree& tree, const rules_runner& rules) {
    boost::optional<fuzzy_date> from, to;

    if (auto p_child = tree.get_child_optional("From"))
        from = fuzzy_date::from_ptree(*p_child, rules);

    if (auto p_child = tree.get_child_optional("To"))
        to = fuzzy_date::from_ptree(*p_child, rules);

    return fuzzy_date_range{ from, to, rules };
}


days fuzzy_date_range::to_duration() const {
    return _to.to_calendar_date() - _from.to_calendar_date();
}


int fuzzy_date_range::compare(const fuzzy_date_range& other) const noexcept {
    const int c = _from.compare(other._from);
    return (c != 0) ? c : _to.compare(other._to);
}


std::string fuzzy_date_range::to_string() const {
    return _from.to_string() + "-" + _to.to_string();
}


void fuzzy_date_range::to_ptree(pt::ptree* p_out) const {
    if (p_out == nullptr)
        throw null_argument_error("p_out");

    pt::ptree from, to;
    _from.to_ptree(&from);
    _to.to_ptree(&to);

    p_out->put_child("From", from);
    p_out->put_child("To", to);
}


std::ostream& operator<<(std::ostream& os, const fuzzy_date_range& r) {
    return os << r.to_string();
}


_FZD_NAMESPACE_END
