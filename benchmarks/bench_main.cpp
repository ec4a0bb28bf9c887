#include "sexp/parser.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_parse; size_t atoms; size_t bytes; };

static RunResult bench_case(const char* name, const std::string &program, int iterations){
    sexp::parse_options opts;
    opts.max_depth = 4096;
    size_t atoms = 0;
    auto t0 = Clock::now();
    for(int i = 0; i < iterations; ++i){
        sexp::parse_result r = sexp::try_parse(program, opts);
        if(!r.success){
            std::cerr << "[bench] case '" << name << "' failed: " << r.diagnostic->message << "\n";
            return {0.0, 0, program.size()};
        }
        atoms = r.atoms.size();
    }
    auto t1 = Clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count() / iterations;
    return { ms, atoms, program.size() };
}

static std::string repeat(const std::string& s, int n){ std::string out; for(int i=0;i<n;++i) out += s; return out; }

int main(){
    struct Case { const char* name; std::string prog; int iterations; };
    std::vector<Case> cases;

    // Case 1: many small flat forms
    cases.push_back({ "flat_forms", repeat("(define x (+ 1 2 3 4 5))\n", 2000), 50 });

    // Case 2: quoted/templated forms with all bracket kinds
    cases.push_back({ "quasi_templates", repeat("`(let [(a ,b) {c ,@d}] 'e \"str ing\")\n", 2000), 50 });

    // Case 3: one deep nest
    cases.push_back({ "deep_nest", repeat("(a ", 1000) + repeat(")", 1000), 200 });

    std::cout << "name,ms_parse,atoms,bytes\n";
    for(const auto &c : cases){
        auto r = bench_case(c.name, c.prog, c.iterations);
        std::cout << c.name << "," << r.ms_parse << "," << r.atoms << "," << r.bytes << "\n";
    }
    return 0;
}
