#include "sexp/print.hpp"
#include <functional>
#include <sstream>

namespace sexp {

const char* to_string(prefix_kind k){
    switch(k){
        case prefix_kind::quote: return "quote";
        case prefix_kind::quasi_quote: return "quasi-quote";
        case prefix_kind::unquote: return "unquote";
        case prefix_kind::unquote_splicing: return "unquote-splicing";
    }
    return "<unknown>";
}

const char* to_string(bracket_kind k){
    switch(k){
        case bracket_kind::round: return "round";
        case bracket_kind::curly: return "curly";
        case bracket_kind::square: return "square";
    }
    return "<unknown>";
}

const char* marker(prefix_kind k){
    switch(k){
        case prefix_kind::quote: return "'";
        case prefix_kind::quasi_quote: return "`";
        case prefix_kind::unquote: return ",";
        case prefix_kind::unquote_splicing: return ",@";
    }
    return "";
}

char open_char(bracket_kind k){ return k==bracket_kind::curly ? '{' : k==bracket_kind::square ? '[' : '('; }
char close_char(bracket_kind k){ return k==bracket_kind::curly ? '}' : k==bracket_kind::square ? ']' : ')'; }

// ",@" reads back as one marker, so an unquoted body that starts with '@'
// is kept apart from its ','.
static std::string marker_before(const atom& a, char first){
    if(!a.prefix) return "";
    std::string out = marker(*a.prefix);
    if(*a.prefix == prefix_kind::unquote && first == '@') out += ' ';
    return out;
}

const char* kind_name(const atom& a){
    if(is_ident(a)) return "ident";
    if(is_string(a)) return "string";
    return "list";
}

std::string to_string(const atom& a){
    struct V {
        std::string operator()(const ident& i) const { return i.text; }
        std::string operator()(const string_lit& s) const { return '"' + s.text + '"'; }
        std::string operator()(const list& l) const {
            std::string out(1, open_char(l.bracket));
            bool first = true;
            for(auto& ch : l.elems){
                if(!first) out += ' ';
                first = false;
                out += to_string(*ch);
            }
            out += close_char(l.bracket);
            return out;
        }
    };
    std::string body = std::visit(V{}, a.kind);
    return marker_before(a, body.empty() ? '\0' : body.front()) + body;
}

std::string to_string(const program& p){
    std::string out;
    for(size_t i=0;i<p.size(); ++i){
        if(i) out += '\n';
        out += to_string(*p[i]);
    }
    return out;
}

std::string to_pretty_string(const atom& a, int indentWidth){
    // Lists made only of identifiers and strings stay on one line while they
    // are short; everything else puts one child per line.
    auto indentStr = [](int spaces) -> std::string {
        if (spaces < 0) spaces = 0;
        return std::string(static_cast<size_t>(spaces), ' ');
    };
    const size_t MAX_INLINE_LEN = 80;

    std::function<std::string(const atom&, int)> pp = [&](const atom& x, int indent) -> std::string {
        const list* l = as_list(x);
        if(!l) return to_string(x);
        std::string pre = marker_before(x, open_char(l->bracket));
        if(l->elems.empty()) return pre + open_char(l->bracket) + close_char(l->bracket);
        bool allLeaves = true; for(auto& e: l->elems){ if(is_list(*e)){ allLeaves=false; break; } }
        if(allLeaves){
            auto inlineForm = to_string(x);
            if(inlineForm.size() + static_cast<size_t>(indent) <= MAX_INLINE_LEN) return inlineForm;
        }
        std::string out = pre + open_char(l->bracket) + '\n'; size_t i=0;
        for(auto& e: l->elems){
            out += indentStr(indent + indentWidth) + pp(*e, indent + indentWidth);
            if(++i<l->elems.size()) out += '\n';
        }
        out += '\n' + indentStr(indent) + close_char(l->bracket);
        return out;
    };
    return pp(a, 0);
}

static void debug_impl(std::ostringstream& os, const atom& a, int indent){
    os<<std::string(static_cast<size_t>(indent)*2, ' ')<<kind_name(a);
    if(auto* l = as_list(a)) os<<'('<<to_string(l->bracket)<<')';
    if(a.prefix) os<<" prefix="<<to_string(*a.prefix);
    os<<" @"<<a.loc.to_string();
    if(auto* i = as_ident(a)) os<<' '<<i->text;
    if(auto* s = as_string(a)) os<<" \""<<s->text<<'"';
    os<<'\n';
    if(auto* l = as_list(a)) for(auto& ch : l->elems) debug_impl(os, *ch, indent + 1);
}

std::string to_debug_string(const atom& a){
    std::ostringstream os; debug_impl(os, a, 0); return os.str();
}

std::string to_debug_string(const program& p){
    std::ostringstream os; for(auto& a : p) debug_impl(os, *a, 0); return os.str();
}

} // namespace sexp
