#include "cli.hpp"
#include "fzd.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/tokenizer.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <string>
#include <vector>
#include <algorithm>
#include <fstream>
#include <stdexcept>

using namespace std;
using namespace boost::filesystem;
namespace po = boost::program_options;
namespace pt = boost::property_tree;


namespace {

/* inputs that made it through evaluation, with the derived values that can still fail */
struct evaluated_date {
    fzd::fuzzy_date date;
    string canonical;
};

struct evaluated_range {
    fzd::fuzzy_date_range range;
    fzd::days duration;
};


/* FROM:TO, where either side may be empty to mean an unknown endpoint */
fzd::fuzzy_date_range parse_range(const string& spec, const fzd::rules_runner& rules) {
    typedef boost::tokenizer< boost::char_separator<char> > tokenizer_t;
    tokenizer_t tok(spec, boost::char_separator<char>(":", "", boost::keep_empty_tokens));

    const vector<string> sides(tok.begin(), tok.end());

    if (sides.size() != 2)
        throw fzd::format_error("Malformed range '%s' (expected FROM:TO)", spec.c_str());

    boost::optional<fzd::fuzzy_date> from, to;

    if (!sides[0].empty()) from = fzd::fuzzy_date::parse(sides[0], rules);
    if (!sides[1].empty()) to   = fzd::fuzzy_date::parse(sides[1], rules);

    return fzd::fuzzy_date_range{ from, to, rules };
}

}


int cli_main(int argc, const char** argv, std::ostream& out, std::ostream& err) {
    try {
        vector<string> opt_dates;
        vector<string> opt_ranges;
        int opt_add_years  = 0;
        int opt_add_months = 0;
        int opt_add_days   = 0;
        bool opt_strict_hierarchy = false;
        bool opt_allow_inverted   = false;

        /* command-line & configuration file parameter specification */

        po::options_description opt_spec{ "Options" };
        opt_spec.add_options()
            ("help,h", "Show help information")
            ("config,c",
                po::value<path>(),
                "Configuration file")
            ("date,d",
                po::value<vector<string>>(&opt_dates)->composing(),
                "Fuzzy date to evaluate: YYYY, YYYY/MM or YYYY/MM/DD (repeatable; also accepted positionally)")
            ("range,r",
                po::value<vector<string>>(&opt_ranges)->composing(),
                "Fuzzy date range FROM:TO; either side may be empty (repeatable)")
            ("today",
                "Also evaluate today's date")
            ("sort",
                "Print dates in fuzzy order instead of input order")
            ("json",
                "Print results as JSON")
            ("add-years",
                po::value<int>(&opt_add_years)->default_value(0),
                "Shift every date by this many years")
            ("add-months",
                po::value<int>(&opt_add_months)->default_value(0),
                "Shift every date with a known month by this many months")
            ("add-days",
                po::value<int>(&opt_add_days)->default_value(0),
                "Shift every date with a known day by this many days")
            ("strict-hierarchy",
                po::bool_switch(&opt_strict_hierarchy),
                "Reject a day without a month, or a month without a year")
            ("allow-inverted-ranges",
                po::bool_switch(&opt_allow_inverted),
                "Accept ranges whose end precedes their start")
            ;

        po::positional_options_description pos_spec;
        pos_spec.add("date", -1);

        /* parse command line & optional configuration file (command-line options override --config file options)
         *
         * example config file contents:
         *
         *   strict-hierarchy = true
         *   date = 2019/03
         *   range = 2018:2019/06/30
         */

        po::variables_map opt;
        po::store(po::command_line_parser(argc, argv).options(opt_spec).positional(pos_spec).run(), opt);

        if (opt.count("config")) {
            const path cfg_path = opt["config"].as<path>();

            if (!exists(cfg_path))
                throw runtime_error("config file specified with --config does not exist: " + cfg_path.string());

            std::ifstream f_cfg{ cfg_path.string() };

            if (f_cfg)
                po::store(po::parse_config_file(f_cfg, opt_spec), opt);
            else
                throw runtime_error("failed to open config file specified with --config: " + cfg_path.string());
        }

        if (opt.count("help")) {
            out << opt_spec << endl;
            return 0;
        }

        po::notify(opt);

        fzd::rules_options rules_opts;
        rules_opts.strict_hierarchy       = opt_strict_hierarchy;
        rules_opts.forbid_inverted_ranges = !opt_allow_inverted;

        const fzd::rules_runner rules{ fzd::make_builtin_rules(rules_opts) };

        /* done with program option processing */

        int status = 0;
        vector<evaluated_date> dates;
        vector<evaluated_range> ranges;

        if (opt.count("today"))
            opt_dates.insert(opt_dates.begin(), fzd::fuzzy_date::today(rules).to_canonical_string());

        for (auto&& text : opt_dates) {
            try {
                const fzd::fuzzy_date d = fzd::fuzzy_date::parse(text, rules)
                                              .add_years(opt_add_years)
                                              .add_months(opt_add_months)
                                              .add_days(opt_add_days);

                dates.push_back(evaluated_date{ d, d.to_canonical_string() });
            }
            catch (const fzd::va_error& e) {
                err << "error: " << text << ": " << e.what() << endl;
                status = 2;
            }
        }

        for (auto&& text : opt_ranges) {
            try {
                const fzd::fuzzy_date_range r = parse_range(text, rules);
                ranges.push_back(evaluated_range{ r, r.to_duration() });
            }
            catch (const fzd::va_error& e) {
                err << "error: " << text << ": " << e.what() << endl;
                status = 2;
            }
        }

        if (opt.count("sort")) {
            std::stable_sort(dates.begin(), dates.end(),
                             [](const evaluated_date& a, const evaluated_date& b) { return a.date < b.date; });
            std::stable_sort(ranges.begin(), ranges.end(),
                             [](const evaluated_range& a, const evaluated_range& b) { return a.range < b.range; });
        }

        if (opt.count("json")) {
            pt::ptree root, date_list, range_list;

            for (auto&& e : dates) {
                pt::ptree node;
                e.date.to_ptree(&node);
                date_list.push_back(make_pair("", node));
            }

            for (auto&& e : ranges) {
                pt::ptree node;
                e.range.to_ptree(&node);
                node.put("Days", e.duration.count());
                range_list.push_back(make_pair("", node));
            }

            root.add_child("Dates", date_list);
            root.add_child("Ranges", range_list);
            pt::write_json(out, root);
        }
        else {
            for (auto&& e : dates) {
                out << (e.canonical.empty() ? "-" : e.canonical) << '\t' << e.date;

                if (e.date.is_leap_year())
                    out << "\t(leap year)";

                out << endl;
            }

            for (auto&& e : ranges)
                out << e.range << '\t' << e.duration.count() << " days" << endl;
        }

        return status;
    }
    catch (const exception& e) {
        err << "fatal: " << e.what() << endl;
        return 1;
    }
}
