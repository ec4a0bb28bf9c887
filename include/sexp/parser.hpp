// parser.hpp - source text to span-annotated atoms
#pragma once
#include "sexp/ast.hpp"
#include "sexp/errors.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sexp {

struct parse_options {
    std::string source_name{"<memory>"}; // used in error messages only
    std::size_t max_depth{256};          // deepest list nesting accepted
    bool trace{false};                   // log produced atoms to stderr
};

// Stable diagnostic codes (see diagnostics_json.hpp).
inline constexpr const char* code_syntax_error = "E0100";
inline constexpr const char* code_span_range = "E0200";
inline constexpr const char* code_nesting_limit = "E0300";

struct parse_diagnostic {
    std::string code;
    std::string message;
    std::size_t offset{0};
    std::size_t line{0};   // 0 when unknown
    std::size_t column{0}; // 0 when unknown
    std::vector<std::string> expected;
};

struct parse_result {
    bool success{false};
    program atoms;                               // empty unless success
    std::optional<parse_diagnostic> diagnostic;  // set unless success
};

// Parse a whole source unit. Pure: the same bytes and options always give the
// same atoms or the same exception (syntax_error, span_range_error or
// nesting_error, all derived from parse_error). Safe to call concurrently.
program parse_program(std::string_view src, const parse_options& opts = {});

// Non-throwing form of parse_program for callers that store failures.
parse_result try_parse(std::string_view src, const parse_options& opts = {});

// Single lexical rules, matched at the beginning of text. Trailing input is
// ignored and no surrounding whitespace is skipped. Spans are relative to
// text. An empty result means the rule does not match.
std::optional<prefix_kind> lex_prefix(std::string_view text, std::size_t* consumed = nullptr);
atom_ptr lex_ident(std::string_view text);
atom_ptr lex_string(std::string_view text);

} // namespace sexp
