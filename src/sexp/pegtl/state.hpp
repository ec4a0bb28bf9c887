#pragma once
#include "sexp/ast.hpp"
#include "sexp/parser.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace sexp::pegtl_front {

// Mutable scratch for one parse call. Actions fire bottom-up: a body's kind and
// span are parked in pending_* and picked up by the enclosing prefixed/bare
// action; list children accumulate in the innermost frame.
struct build_state {
    struct marker { prefix_kind kind; span loc; };

    const char* base;            // first byte of the source buffer
    const parse_options& opts;
    std::vector<std::vector<atom_ptr>> frames; // frames[0] collects top-level atoms
    std::vector<marker> prefixes;              // prefixes whose atom is still open
    std::optional<atom_kind> pending_kind;
    span pending_span;

    build_state(const char* b, const parse_options& o) : base(b), opts(o) { frames.emplace_back(); }

    std::size_t offset(const char* p) const { return static_cast<std::size_t>(p - base); }
    // Depth of the innermost open list, 0 at top level.
    std::size_t depth() const { return frames.size() - 1; }
};

} // namespace sexp::pegtl_front
