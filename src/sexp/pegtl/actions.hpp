#pragma once
#include "grammar.hpp"
#include "state.hpp"
#include "sexp/errors.hpp"
#include "sexp/print.hpp"
#include <iostream>
#include <utility>
#include <tao/pegtl.hpp>

namespace sexp::pegtl_front::actions {
using sexp::pegtl_front::build_state;

template<typename Rule>
struct action : tao::pegtl::nothing<Rule> {};

template<typename ActionInput>
span span_of(const ActionInput& in, const build_state& st){ return span(st.offset(in.begin()), st.offset(in.end())); }

template<prefix_kind K>
struct push_prefix {
    template<typename ActionInput>
    static void apply(const ActionInput& in, build_state& st){ st.prefixes.push_back({K, span_of(in, st)}); }
};

template<> struct action< grammar::quote > : push_prefix< prefix_kind::quote > {};
template<> struct action< grammar::quasi_quote > : push_prefix< prefix_kind::quasi_quote > {};
template<> struct action< grammar::unquote > : push_prefix< prefix_kind::unquote > {};
template<> struct action< grammar::unquote_splicing > : push_prefix< prefix_kind::unquote_splicing > {};

struct open_list {
    template<typename ActionInput>
    static void apply(const ActionInput& in, build_state& st){
        const auto at = st.offset(in.begin());
        if(st.depth() >= st.opts.max_depth) throw nesting_error(at, st.opts.max_depth);
        st.frames.emplace_back();
        if(st.opts.trace) std::cerr << "[sexp][parse] open '" << *in.begin() << "' at " << at << " depth " << st.depth() << "\n";
    }
};

template<> struct action< grammar::open_round > : open_list {};
template<> struct action< grammar::open_curly > : open_list {};
template<> struct action< grammar::open_square > : open_list {};

template<bracket_kind B>
struct close_list {
    template<typename ActionInput>
    static void apply(const ActionInput&, build_state& st){
        std::vector<atom_ptr> elems = std::move(st.frames.back());
        st.frames.pop_back();
        st.pending_kind = sexp::list{std::move(elems), B};
    }
};

template<> struct action< grammar::list_round > : close_list< bracket_kind::round > {};
template<> struct action< grammar::list_curly > : close_list< bracket_kind::curly > {};
template<> struct action< grammar::list_square > : close_list< bracket_kind::square > {};

template<> struct action< grammar::ident > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, build_state& st){ st.pending_kind = sexp::ident{in.string()}; }
};

template<> struct action< grammar::string_lit > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, build_state& st){
        // drop the delimiting quotes
        st.pending_kind = sexp::string_lit{std::string(in.begin() + 1, in.end() - 1)};
    }
};

// Runs after whichever body alternative matched; a list body already covers
// the whitespace after its closing delimiter.
template<> struct action< grammar::body > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, build_state& st){ st.pending_span = span_of(in, st); }
};

inline void emit(build_state& st, std::optional<prefix_kind> prefix, span loc){
    auto a = make_atom(prefix, std::move(*st.pending_kind), loc);
    st.pending_kind.reset();
    if(st.opts.trace) std::cerr << "[sexp][parse] " << kind_name(*a) << ' ' << loc.to_string() << ' ' << to_string(*a) << "\n";
    st.frames.back().push_back(std::move(a));
}

template<> struct action< grammar::prefixed > {
    template<typename ActionInput>
    static void apply(const ActionInput&, build_state& st){
        const auto m = st.prefixes.back();
        st.prefixes.pop_back();
        emit(st, m.kind, m.loc + st.pending_span);
    }
};

template<> struct action< grammar::bare > {
    template<typename ActionInput>
    static void apply(const ActionInput&, build_state& st){ emit(st, std::nullopt, st.pending_span); }
};

} // namespace sexp::pegtl_front::actions
