#include "ntup/emitter.hpp"
#include "ntup/errors.hpp"

namespace ntup {

namespace {

const std::string& key_name(const node_ptr& k){ return std::get<keyword>(k->data).name; }

bool has_key(const AssocEntries& entries, const std::string& name){
    for(auto &kv : entries) if(key_name(kv.first) == name) return true;
    return false;
}

} // namespace

AssocEntries apply_wildcard(const Shape& shape, const AssocEntries& overrides){
    const node_ptr* wildcard = nullptr;
    for(auto &kv : overrides){ if(key_name(kv.first) == "_"){ wildcard = &kv.second; break; } }
    if(!wildcard) return overrides;
    AssocEntries out;
    for(auto &f : shape.fields){
        if(!has_key(overrides, f.name)) out.emplace_back(n_kw(f.name), clone(*wildcard));
    }
    for(auto &kv : overrides){ if(key_name(kv.first) != "_") out.push_back(kv); }
    return out;
}

node_ptr FormEmitter::construct_defaults(const Shape& shape, bool in_match){
    return construct(shape, {}, in_match);
}

node_ptr FormEmitter::field_index(const Shape& shape, const std::string& field){
    auto idx = resolve(shape, field);
    if(!idx) throw unknown_field(shape.name, field, shape.field_names());
    return n_i64(static_cast<int64_t>(*idx));
}

node_ptr FormEmitter::construct(const Shape& shape, const AssocEntries& overrides, bool in_match){
    AssocEntries remaining = apply_wildcard(shape, overrides);
    vector_t out; out.elems.reserve(shape.arity());
    for(auto &f : shape.fields){
        node_ptr value;
        for(auto &kv : remaining){ if(key_name(kv.first) == f.name){ value = kv.second; break; } }
        if(value){
            // first occurrence wins; later duplicates of the same key are dropped
            AssocEntries rest; rest.reserve(remaining.size());
            for(auto &kv : remaining) if(key_name(kv.first) != f.name) rest.push_back(kv);
            remaining.swap(rest);
            out.elems.push_back(value);
        } else if(in_match){
            out.elems.push_back(n_sym("_"));
        } else {
            out.elems.push_back(clone(f.default_expr));
        }
    }
    if(!remaining.empty()) throw unknown_field(shape.name, key_name(remaining.front().first), shape.field_names());
    return detail::make_node(std::move(out));
}

node_ptr FormEmitter::to_alist(const Shape& shape, const node_ptr& tuple_expr, const std::vector<node_ptr>* literal_elems){
    if(literal_elems && literal_elems->size() == shape.arity()){
        AssocEntries entries;
        for(size_t i=0; i<shape.arity(); ++i) entries.emplace_back(n_kw(shape.fields[i].name), (*literal_elems)[i]);
        return node_map(std::move(entries));
    }
    std::vector<node_ptr> names;
    for(auto &f : shape.fields) names.push_back(n_kw(f.name));
    return node_list({ n_sym("tuple/to-alist"), n_kw(shape.name), node_vec(std::move(names)), tuple_expr });
}

node_ptr FormEmitter::get_field(const Shape& shape, const node_ptr& tuple_expr, const std::string& field){
    auto idx = resolve(shape, field);
    if(!idx) throw unknown_field(shape.name, field, shape.field_names());
    return node_list({ n_sym("tuple/elem"), tuple_expr, n_i64(static_cast<int64_t>(*idx)) });
}

node_ptr FormEmitter::update(const Shape& shape, const node_ptr& tuple_expr, const AssocEntries& overrides, bool in_match){
    if(in_match) throw update_in_match_context();
    if(overrides.empty()) return clone(tuple_expr);
    node_ptr acc = tuple_expr;
    for(auto &kv : overrides){
        auto idx = resolve(shape, key_name(kv.first));
        if(!idx) throw unknown_field(shape.name, key_name(kv.first), shape.field_names());
        acc = node_list({ n_sym("tuple/put"), acc, n_i64(static_cast<int64_t>(*idx)), kv.second });
    }
    return acc;
}

} // namespace ntup
