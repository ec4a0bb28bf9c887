#pragma once
#include "sexp/parser.hpp"

namespace sexp {

// Build parse options from process env vars. Called by drivers once at start
// up; the parser itself never reads the environment.
//   SEXP_MAX_DEPTH=<n>   positive nesting limit (invalid values are ignored)
//   SEXP_TRACE_PARSE=1   log every produced atom to stderr
parse_options detect_options();

// True when the variable is set to 1/t/T/y/Y.
bool env_flag_enabled(const char* name);

} // namespace sexp
