#include "ntup/diagnostics.hpp"
#include <algorithm>

namespace ntup {

int edit_distance(const std::string& a, const std::string& b){
    std::vector<int> prev(b.size()+1), cur(b.size()+1);
    for(size_t j=0;j<=b.size();++j) prev[j]=(int)j;
    for(size_t i=1;i<=a.size();++i){
        cur[0]=(int)i;
        for(size_t j=1;j<=b.size();++j){
            int cost = a[i-1]==b[j-1] ? 0 : 1;
            cur[j] = std::min({ prev[j]+1, cur[j-1]+1, prev[j-1]+cost });
        }
        std::swap(prev,cur);
    }
    return prev[b.size()];
}

std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist){
    std::vector<std::pair<int,std::string>> scored;
    for(auto &p : pool){ int d = edit_distance(target, p); if(d>0 && d<=maxDist) scored.emplace_back(d, p); }
    std::stable_sort(scored.begin(), scored.end(), [](auto &x, auto &y){ return x.first < y.first; });
    std::vector<std::string> out; for(auto &s : scored) out.push_back(s.second);
    return out;
}

Diagnostic to_diagnostic(const expand_error& e){
    Diagnostic d{ e.code(), e.what(), "", e.line(), e.col(), {} };
    if(auto *uf = dynamic_cast<const unknown_field*>(&e)){
        std::string known;
        for(auto &k : uf->known){ if(!known.empty()) known += ", "; known += ":" + k; }
        d.hint = "known fields: " + (known.empty() ? std::string("(none)") : known);
        for(auto &s : fuzzy_candidates(uf->field, uf->known)) d.notes.push_back(Note{ "did you mean :" + s + "?", e.line(), e.col() });
    } else if(dynamic_cast<const invalid_argument_shape*>(&e)){
        d.hint = "pass a literal :field to read a field or a literal {:field value} to update";
    } else if(dynamic_cast<const update_in_match_context*>(&e)){
        d.hint = "use (name {:field pattern}) to match, updates only build values";
    } else if(dynamic_cast<const non_atom_field_name*>(&e)){
        d.hint = "field names are atoms such as :x or pairs such as [:x 0]";
    } else if(dynamic_cast<const invalid_default_value*>(&e)){
        d.hint = "defaults must be literal data or calls over literal data, not variable references";
    } else if(dynamic_cast<const reserved_shape_name*>(&e)){
        d.hint = "pick a shape name that is not a special form or a tuple/ or alist/ primitive";
    } else if(dynamic_cast<const duplicate_field*>(&e)){
        d.hint = "remove the repeated field";
    }
    return d;
}

} // namespace ntup
