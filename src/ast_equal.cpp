// Structural equality over atom trees.
#include "sexp/ast.hpp"

namespace sexp {

static bool equal_impl(const atom_ptr& a, const atom_ptr& b, bool ignore_spans) {
	if (a.get() == b.get()) return true;
	if (!a || !b) return false;
	if (a->kind.index() != b->kind.index()) return false;
	if (a->prefix != b->prefix) return false;
	if (!ignore_spans && a->loc != b->loc) return false;

	struct Visitor {
		const atom_ptr& a; const atom_ptr& b; bool ignore_spans;
		bool operator()(const ident& l) const { return l.text == std::get<ident>(b->kind).text; }
		bool operator()(const string_lit& l) const { return l.text == std::get<string_lit>(b->kind).text; }
		bool operator()(const list& l) const {
			const auto& r = std::get<list>(b->kind);
			if (l.bracket != r.bracket) return false;
			if (l.elems.size() != r.elems.size()) return false;
			for (size_t i = 0; i < l.elems.size(); ++i) if (!equal_impl(l.elems[i], r.elems[i], ignore_spans)) return false;
			return true;
		}
	};

	return std::visit(Visitor{a, b, ignore_spans}, a->kind);
}

bool equal(const atom_ptr& a, const atom_ptr& b, bool ignore_spans) { return equal_impl(a, b, ignore_spans); }

bool equal(const program& a, const program& b, bool ignore_spans) {
	if (a.size() != b.size()) return false;
	for (size_t i = 0; i < a.size(); ++i) if (!equal_impl(a[i], b[i], ignore_spans)) return false;
	return true;
}

} // namespace sexp
