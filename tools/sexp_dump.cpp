#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "sexp/parser.hpp"
#include "sexp/print.hpp"
#include "sexp/env.hpp"
#include "sexp/diagnostics_json.hpp"

using namespace sexp;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path, std::ios::binary); if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str(); return true;
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: sexp_dump <file> [--canonical|--pretty|--spans|--json]\n"; return 1; }
    std::string file = argv[1];
    std::string mode = "--spans";
    if(argc>2) mode = argv[2];
    if(mode!="--canonical" && mode!="--pretty" && mode!="--spans" && mode!="--json"){ std::cerr << "unknown mode: " << mode << "\n"; return 1; }

    std::string src;
    if(!read_file(file, src)){ std::cerr << "[sexp-dump] failed to read " << file << "\n"; return 1; }

    parse_options opts = detect_options();
    opts.source_name = file;
    parse_result res = try_parse(src, opts);
    maybe_print_json(res);

    if(mode=="--json"){ std::cout << diagnostics_to_json(res) << "\n"; return res.success ? 0 : 2; }
    if(!res.success){ std::cerr << res.diagnostic->message << "\n"; return 2; }

    if(mode=="--canonical") std::cout << to_string(res.atoms) << "\n";
    else if(mode=="--pretty"){ for(auto& a : res.atoms) std::cout << to_pretty_string(a) << "\n"; }
    else std::cout << to_debug_string(res.atoms);
    std::cerr << "[sexp-dump] " << res.atoms.size() << " top-level atoms\n";
    return 0;
}
