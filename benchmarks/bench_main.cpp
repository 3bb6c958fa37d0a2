#include "ntup/reader.hpp"
#include "ntup/expander.hpp"
#include "ntup/interp.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_expand; double ms_eval; size_t forms; };

static RunResult bench_case(const char* name, const std::string &program, int reps){
    auto forms = ntup::parse_all(program, name);
    RunResult r{0.0, 0.0, 0};
    for(int i=0; i<reps; ++i){
        ntup::Expander expander(ntup::ExpandOptions{});
        auto t0 = Clock::now();
        auto res = expander.expand_program(forms);
        auto t1 = Clock::now();
        if(!res.success){
            std::cerr << "[bench] case '" << name << "' failed expansion\n";
            return {0.0, 0.0, 0};
        }
        ntup::Interpreter interp;
        try {
            (void)interp.run(res.forms);
        } catch(const ntup::eval_error& e){
            std::cerr << "[bench] case '" << name << "' failed at run time: " << e.what() << "\n";
            return {0.0, 0.0, 0};
        }
        auto t2 = Clock::now();
        r.ms_expand += std::chrono::duration<double, std::milli>(t1 - t0).count();
        r.ms_eval += std::chrono::duration<double, std::milli>(t2 - t1).count();
        r.forms = res.forms.size();
    }
    r.ms_expand /= reps; r.ms_eval /= reps;
    return r;
}

// A module with `n` construct/update/get call sites against one shape.
static std::string many_calls(int n){
    std::string s = "(module :name Bench\n  (deftuple :point {:x 0 :y 0 :z 0})\n  (def p (point))\n";
    for(int i=0;i<n;++i){
        s += "  (def p (point p {:x " + std::to_string(i) + " :z (point p :y)}))\n";
    }
    s += "  (point p))\n";
    return s;
}

int main(){
    int reps = 20;
    if(const char* v = std::getenv("NTUP_BENCH_REPS")) reps = std::max(1, std::atoi(v));

    struct Case { const char* name; std::string prog; };
    std::vector<Case> cases;
    cases.push_back({ "construct_defaults", "(module :name B1 (deftuple :t [:a :b :c :d :e :f :g :h]) (t) (t {:_ 1 :c 3}))" });
    cases.push_back({ "update_chain_100", many_calls(100) });
    cases.push_back({ "update_chain_1000", many_calls(1000) });
    cases.push_back({
        "pattern_match",
        "(module :name B3\n"
        "  (deftuple :pair [[:l 0] [:r 0]])\n"
        "  (let [(pair {:l a}) (pair {:l 1 :r 2})\n"
        "        ok (match? (pair {:_ _ :r 2}) (pair {:r 2}))]\n"
        "    (if ok a 0)))"
    });

    std::cout << "name,ms_expand,ms_eval,forms\n";
    for(const auto &c : cases){
        auto r = bench_case(c.name, c.prog, reps);
        std::cout << c.name << "," << r.ms_expand << "," << r.ms_eval << "," << r.forms << "\n";
    }
    return 0;
}
