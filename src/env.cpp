#include "sexp/env.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

namespace sexp {

bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

parse_options detect_options(){
    parse_options o{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    // Nesting limit
    if (const char* v = get("SEXP_MAX_DEPTH")) {
        char* end = nullptr;
        unsigned long long n = std::strtoull(v, &end, 10);
        if (end && *end == '\0' && n > 0 && v[0] != '-') o.max_depth = static_cast<std::size_t>(n);
        else std::cerr << "[sexp][cfg] ignoring SEXP_MAX_DEPTH=" << v << "\n";
    }

    // Tracing
    o.trace = env_flag_enabled("SEXP_TRACE_PARSE");

    return o;
}

} // namespace sexp
