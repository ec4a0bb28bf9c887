#include "sexp/diagnostics_json.hpp"
#include <sstream>
#include <cstdlib>
#include <cstdio>

namespace sexp {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostic_to_json(const parse_diagnostic& d){
    std::ostringstream os;
    os<<"{"
        "\"code\":"<<json_escape(d.code)
        <<",\"message\":"<<json_escape(d.message)
        <<",\"offset\":"<<d.offset
        <<",\"line\":"<<d.line
        <<",\"col\":"<<d.column
        <<",\"expected\":[";
    for(size_t i=0;i<d.expected.size(); ++i){
        if(i) os<<",";
        os<<json_escape(d.expected[i]);
    }
    os<<"]}";
    return os.str();
}

std::string diagnostics_to_json(const parse_result& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")
      <<",\"atoms\":"<<r.atoms.size()
      <<",\"errors\":[";
    if(r.diagnostic) os<<diagnostic_to_json(*r.diagnostic);
    os<<"]}";
    return os.str();
}

void maybe_print_json(const parse_result& r){
    if(const char* env = std::getenv("SEXP_DIAG_JSON")){
        if(env[0]=='1'){
            auto js=diagnostics_to_json(r);
            std::fprintf(stderr, "%s\n", js.c_str());
        }
    }
}

} // namespace sexp
