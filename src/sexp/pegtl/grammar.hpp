#pragma once
#include <tao/pegtl.hpp>

namespace sexp::pegtl_front::grammar {
using namespace tao::pegtl;

// Whitespace is exactly space, tab, newline and carriage return.
struct ws_char : one< ' ', '\t', '\n', '\r' > {};
struct ws : star< ws_char > {};

// Prefix markers. unquote_splicing is tried before unquote so that ",@" is
// never read as "," followed by an identifier starting with '@'.
struct quote : one< '\'' > {};
struct quasi_quote : one< '`' > {};
struct unquote_splicing : string< ',', '@' > {};
struct unquote : one< ',' > {};
struct prefix : sor< unquote_splicing, unquote, quote, quasi_quote > {};

struct ident : plus< not_one< ' ', '\t', '\n', '\r', '(', ')', '{', '}', '[', ']' > > {};

// No escapes: a backslash is an ordinary character.
struct string_lit : seq< one< '"' >, star< not_one< '"' > >, one< '"' > > {};

struct sexpr;
struct items : star< sexpr, ws > {};

struct open_round : one< '(' > {};
struct close_round : one< ')' > {};
struct open_curly : one< '{' > {};
struct close_curly : one< '}' > {};
struct open_square : one< '[' > {};
struct close_square : one< ']' > {};

// Whitespace after the closing delimiter belongs to the list.
struct list_round : seq< open_round, ws, items, must< close_round >, ws > {};
struct list_curly : seq< open_curly, ws, items, must< close_curly >, ws > {};
struct list_square : seq< open_square, ws, items, must< close_square >, ws > {};

// An unterminated string falls through to ident, like any other run of
// non-delimiter characters.
struct body : sor< list_round, list_curly, list_square, string_lit, ident > {};

struct prefixed : seq< prefix, ws, must< body > > {};
struct bare : seq< body > {};
struct sexpr : sor< prefixed, bare > {};

struct program : seq< ws, items, must< eof > > {};

} // namespace sexp::pegtl_front::grammar
