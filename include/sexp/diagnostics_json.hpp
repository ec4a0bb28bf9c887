// diagnostics_json.hpp - JSON serialization for parse results
#pragma once
#include "sexp/parser.hpp"
#include <string>

namespace sexp {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"code":..,"message":..,"offset":..,"line":..,"col":..,"expected":[..]}
std::string diagnostic_to_json(const parse_diagnostic& d);

// Serialize a parse result to a compact JSON string:
// {"success":bool,"atoms":N,"errors":[diagnostic...]}
std::string diagnostics_to_json(const parse_result& r);

// If SEXP_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const parse_result& r);

} // namespace sexp
