#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "ntup/reader.hpp"
#include "ntup/expander.hpp"
#include "ntup/diagnostics_json.hpp"
#include "ntup/interp.hpp"

using namespace ntup;

static std::string read_file(const std::string& path){ std::ifstream ifs(path); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

static void print_diagnostics(const ExpandResult& res){
    for(auto &e : res.errors){
        std::cerr << "error"; if(!e.code.empty()) std::cerr << "["<<e.code<<"]"; std::cerr << ": " << e.message; if(e.line>=0) std::cerr << " (line "<<e.line<<":"<<e.col<<")"; std::cerr << "\n";
        if(!e.hint.empty()) std::cerr << "  hint: " << e.hint << "\n";
        for(auto &n : e.notes){ std::cerr << "  note: " << n.message; if(n.line>=0) std::cerr << " (line "<<n.line<<":"<<n.col<<")"; std::cerr << "\n"; }
    }
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: ntupc <file> [--expand] [--run] [--json]\n"; return 1; }
    std::string file; bool show_expand = false, run = false, json = false;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a == "--expand") show_expand = true;
        else if(a == "--run") run = true;
        else if(a == "--json") json = true;
        else if(!a.empty() && a[0] == '-'){ std::cerr << "unknown option: " << a << "\n"; return 1; }
        else file = a;
    }
    if(file.empty()){ std::cerr << "usage: ntupc <file> [--expand] [--run] [--json]\n"; return 1; }
    if(!show_expand && !run) show_expand = true;
    std::string src = read_file(file); if(src.empty()){ std::cerr << "failed to read file\n"; return 1; }

    std::vector<node_ptr> forms;
    try {
        forms = parse_all(src, file);
    } catch(const parse_error& e){
        std::cerr << "parse error: " << e.what() << "\n";
        return 2;
    }

    ExpandOptions opts = detect_options();
    if(json) opts.diag_json = true;
    Expander expander(opts);
    ExpandResult res = expander.expand_program(forms);
    maybe_print_json(res, opts);
    if(!res.success){ std::cerr << "Expansion failed:\n"; print_diagnostics(res); return 3; }

    if(show_expand){
        for(auto &f : res.forms) std::cout << to_pretty_string(f) << "\n";
    }
    if(run){
        Interpreter interp;
        try {
            Value v = interp.run(res.forms);
            std::cout << "Result: " << inspect(v) << "\n";
        } catch(const eval_error& e){
            std::cerr << "runtime error[" << e.code() << "]: " << e.what() << "\n";
            return 4;
        }
    }
    return 0;
}
