#include "sexp/parser.hpp"
#include "sexp/pegtl/grammar.hpp"
#include "sexp/pegtl/state.hpp"
#include "sexp/pegtl/actions.hpp"
#include "sexp/pegtl/control.hpp"
#include <utility>
#include <tao/pegtl.hpp>

namespace sexp {
using namespace sexp::pegtl_front;

namespace {

// 1-based line/column of a byte offset, for errors raised outside the PEGTL
// input (span overflow, nesting limit).
std::pair<std::size_t, std::size_t> line_col(std::string_view src, std::size_t offset){
    std::size_t line = 1, col = 1;
    for(std::size_t i = 0; i < offset && i < src.size(); ++i){
        if(src[i] == '\n'){ ++line; col = 1; } else ++col;
    }
    return {line, col};
}

template<typename Rule>
std::optional<std::size_t> match_length(std::string_view text){
    if(text.empty()) return std::nullopt;
    tao::pegtl::memory_input in(text.data(), text.size(), "<lex>");
    if(!tao::pegtl::parse< Rule >(in)) return std::nullopt;
    return static_cast<std::size_t>(in.current() - text.data());
}

} // namespace

program parse_program(std::string_view src, const parse_options& opts){
    tao::pegtl::memory_input in(src.data(), src.size(), opts.source_name);
    build_state st(src.data(), opts);
    if(!tao::pegtl::parse< grammar::program, actions::action, pegtl_front::control >(in, st)){
        // program ends in must<eof>, so failure always raises; keep the contract explicit anyway
        const auto pos = in.position();
        throw syntax_error(opts.source_name, pos.byte, pos.line, pos.column, expected_for<tao::pegtl::eof>());
    }
    return std::move(st.frames.front());
}

parse_result try_parse(std::string_view src, const parse_options& opts){
    parse_result r;
    try {
        r.atoms = parse_program(src, opts);
        r.success = true;
    } catch (const syntax_error& e) {
        r.diagnostic = parse_diagnostic{code_syntax_error, e.what(), e.offset(), e.line(), e.column(), e.expected()};
    } catch (const span_range_error& e) {
        auto lc = line_col(src, e.start());
        r.diagnostic = parse_diagnostic{code_span_range, e.what(), e.start(), lc.first, lc.second, {}};
    } catch (const nesting_error& e) {
        auto lc = line_col(src, e.offset());
        r.diagnostic = parse_diagnostic{code_nesting_limit, e.what(), e.offset(), lc.first, lc.second, {}};
    }
    return r;
}

std::optional<prefix_kind> lex_prefix(std::string_view text, std::size_t* consumed){
    auto n = match_length< grammar::prefix >(text);
    if(!n) return std::nullopt;
    if(consumed) *consumed = *n;
    if(*n == 2) return prefix_kind::unquote_splicing;
    switch(text.front()){
        case '\'': return prefix_kind::quote;
        case '`': return prefix_kind::quasi_quote;
        default: return prefix_kind::unquote;
    }
}

atom_ptr lex_ident(std::string_view text){
    auto n = match_length< grammar::ident >(text);
    if(!n) return nullptr;
    return make_ident(std::string(text.substr(0, *n)), span(0, *n));
}

atom_ptr lex_string(std::string_view text){
    auto n = match_length< grammar::string_lit >(text);
    if(!n) return nullptr;
    return make_string(std::string(text.substr(1, *n - 2)), span(0, *n));
}

} // namespace sexp
