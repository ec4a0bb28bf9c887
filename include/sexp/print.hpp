// print.hpp - textual renderings of atoms and programs
#pragma once
#include "sexp/ast.hpp"
#include <string>

namespace sexp {

const char* to_string(prefix_kind k);   // "quote", "quasi-quote", ...
const char* to_string(bracket_kind k);  // "round", "curly", "square"
const char* marker(prefix_kind k);      // "'", "`", ",", ",@"
char open_char(bracket_kind k);
char close_char(bracket_kind k);
const char* kind_name(const atom& a);   // "ident", "string", "list"

// Canonical single-line source form. Re-parsing it gives an equal program
// (ignoring spans). An unquote whose body starts with '@' is written ", @x".
std::string to_string(const atom& a);
inline std::string to_string(const atom_ptr& a) { return to_string(*a); }
// Top-level atoms separated by newlines.
std::string to_string(const program& p);

// Pretty printer with newlines and indentation for readability
std::string to_pretty_string(const atom& a, int indentWidth = 2);
inline std::string to_pretty_string(const atom_ptr& a, int indentWidth = 2) { return to_pretty_string(*a, indentWidth); }

// One line per node: kind, prefix, span and text, children indented.
std::string to_debug_string(const atom& a);
std::string to_debug_string(const program& p);

} // namespace sexp
