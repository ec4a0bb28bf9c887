// ast.hpp - immutable span-annotated s-expression tree
#pragma once
#include "sexp/span.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sexp
{

    // Quoting marker written in front of an atom: ' ` , ,@
    enum class prefix_kind
    {
        quote,
        quasi_quote,
        unquote,
        unquote_splicing
    };

    // Delimiter pair that enclosed a list. Purely syntactic; later stages may
    // give the three kinds different meanings.
    enum class bracket_kind
    {
        round,
        curly,
        square
    };

    struct atom;
    using atom_ptr = std::shared_ptr<const atom>;

    struct ident
    {
        std::string text;
    };
    // Raw characters between the quotes; escapes are not interpreted.
    struct string_lit
    {
        std::string text;
    };
    struct list
    {
        std::vector<atom_ptr> elems;
        bracket_kind bracket = bracket_kind::round;
    };

    using atom_kind = std::variant<ident, string_lit, list>;

    struct atom
    {
        std::optional<prefix_kind> prefix;
        atom_kind kind;
        span loc;
    };

    // Top-level atoms of one source unit, in source order.
    using program = std::vector<atom_ptr>;

    inline atom_ptr make_atom(std::optional<prefix_kind> prefix, atom_kind kind, span loc)
    {
        return std::make_shared<const atom>(atom{prefix, std::move(kind), loc});
    }
    inline atom_ptr make_ident(std::string text, span loc = {}, std::optional<prefix_kind> prefix = std::nullopt)
    {
        return make_atom(prefix, ident{std::move(text)}, loc);
    }
    inline atom_ptr make_string(std::string text, span loc = {}, std::optional<prefix_kind> prefix = std::nullopt)
    {
        return make_atom(prefix, string_lit{std::move(text)}, loc);
    }
    inline atom_ptr make_list(std::vector<atom_ptr> elems, bracket_kind bracket = bracket_kind::round, span loc = {},
                              std::optional<prefix_kind> prefix = std::nullopt)
    {
        return make_atom(prefix, list{std::move(elems), bracket}, loc);
    }

    inline bool is_ident(const atom &a) { return std::holds_alternative<ident>(a.kind); }
    inline bool is_string(const atom &a) { return std::holds_alternative<string_lit>(a.kind); }
    inline bool is_list(const atom &a) { return std::holds_alternative<list>(a.kind); }
    inline const ident *as_ident(const atom &a) { return std::get_if<ident>(&a.kind); }
    inline const string_lit *as_string(const atom &a) { return std::get_if<string_lit>(&a.kind); }
    inline const list *as_list(const atom &a) { return std::get_if<list>(&a.kind); }

    // Structural deep equality. With ignore_spans the comparison only looks at
    // prefixes, kinds, texts and bracket kinds.
    bool equal(const atom_ptr &a, const atom_ptr &b, bool ignore_spans = true);
    bool equal(const program &a, const program &b, bool ignore_spans = true);

} // namespace sexp
