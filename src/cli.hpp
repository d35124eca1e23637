// -*- c++ -*-

#pragma once

#include <ostream>


/* fuzzydate-cli with its output streams supplied by the caller. returns the process exit status: 0 on success, 2 if any
 * date or range was rejected, 1 on a fatal error (bad options, unreadable config file). */

int cli_main(int argc, const char** argv, std::ostream& out, std::ostream& err);
