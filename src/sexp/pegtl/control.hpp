#pragma once
#include "grammar.hpp"
#include "sexp/errors.hpp"
#include <string>
#include <utility>
#include <vector>
#include <tao/pegtl.hpp>

namespace sexp::pegtl_front {

// Labelled alternatives reported when a must<> rule fails. Only rules wrapped
// in must<> by the grammar are ever raised.
template<typename Rule>
std::vector<std::string> expected_for(){ return {}; }

inline std::vector<std::string> sexpr_starts(){ return {"prefix", "list", "string", "ident"}; }
inline std::vector<std::string> sexpr_starts_or(std::string closer){ auto v = sexpr_starts(); v.push_back(std::move(closer)); return v; }

template<> inline std::vector<std::string> expected_for<grammar::body>(){ return {"list", "string", "ident"}; }
template<> inline std::vector<std::string> expected_for<grammar::close_round>(){ return sexpr_starts_or("')'"); }
template<> inline std::vector<std::string> expected_for<grammar::close_curly>(){ return sexpr_starts_or("'}'"); }
template<> inline std::vector<std::string> expected_for<grammar::close_square>(){ return sexpr_starts_or("']'"); }
template<> inline std::vector<std::string> expected_for<tao::pegtl::eof>(){ return sexpr_starts_or("end of input"); }

template<typename Rule>
struct control : tao::pegtl::normal<Rule> {
    template<typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&...){
        const auto pos = in.position();
        throw syntax_error(pos.source, pos.byte, pos.line, pos.column, expected_for<Rule>());
    }
};

} // namespace sexp::pegtl_front
