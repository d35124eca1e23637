#pragma once
#include "config.hpp"

#include "error.hpp"
#include "error_queue.hpp"
#include "calendar.hpp"
#include "rule.hpp"
#include "rules_runner.hpp"
#include "builtin_rules.hpp"
#include "fuzzy_date.hpp"
#include "fuzzy_date_range.hpp"
