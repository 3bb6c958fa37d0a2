#include "ntup/classify.hpp"
#include "ntup/errors.hpp"

namespace ntup {

bool is_assoc_literal(const node& n){
    if(!is_map(n)) return false;
    for(auto &kv : std::get<map>(n.data).entries){
        if(!kv.first || !is_keyword(*kv.first)) return false;
    }
    return true;
}

static AssocEntries entries_of(const node& n){ return std::get<map>(n.data).entries; }

CallSite classify(const list& form){
    const auto &e = form.elems; // e[0] is the shape name
    if(e.size() == 1) return callsite::Empty{};
    if(e.size() == 2){
        const node &arg = *e[1];
        if(auto *kw = as_keyword(arg)) return callsite::SingleFieldName{ kw->name };
        if(is_assoc_literal(arg)) return callsite::SingleAssocList{ entries_of(arg) };
        return callsite::SingleOpaque{ e[1] };
    }
    if(e.size() == 3){
        const node &arg = *e[2];
        if(auto *kw = as_keyword(arg)) return callsite::GetField{ e[1], kw->name };
        if(is_assoc_literal(arg)) return callsite::UpdateFields{ e[1], entries_of(arg) };
        throw invalid_argument_shape(to_string(arg));
    }
    list rest; rest.elems.assign(e.begin()+1, e.end());
    throw invalid_argument_shape(to_string(node{ rest, {} }));
}

node_ptr dispatch(CodeEmitter& emitter, const Shape& shape, const CallSite& site, const ExpandEnv& env,
                  const std::function<node_ptr(const node_ptr&, const ExpandEnv&)>& expand){
    struct V {
        CodeEmitter& em; const Shape& shape; const ExpandEnv& env;
        const std::function<node_ptr(const node_ptr&, const ExpandEnv&)>& expand;
        node_ptr operator()(const callsite::Empty&) const { return em.construct_defaults(shape, env.in_match); }
        node_ptr operator()(const callsite::SingleFieldName& s) const { return em.field_index(shape, s.field); }
        node_ptr operator()(const callsite::SingleAssocList& s) const { return em.construct(shape, s.entries, env.in_match); }
        node_ptr operator()(const callsite::SingleOpaque& s) const {
            // Narrow statically only when the expansion is a tuple literal of exactly our arity.
            node_ptr expanded = expand ? expand(s.expr, env) : s.expr;
            if(expanded && is_vector(*expanded)){
                const auto &elems = std::get<vector_t>(expanded->data).elems;
                if(elems.size() == shape.arity()) return em.to_alist(shape, expanded, &elems);
            }
            return em.to_alist(shape, expanded, nullptr);
        }
        node_ptr operator()(const callsite::GetField& s) const { return em.get_field(shape, s.container, s.field); }
        node_ptr operator()(const callsite::UpdateFields& s) const { return em.update(shape, s.container, s.entries, env.in_match); }
    };
    return std::visit(V{emitter, shape, env, expand}, site);
}

const char* callsite_name(const CallSite& site){
    switch(site.index()){
        case 0: return "construct-defaults";
        case 1: return "index";
        case 2: return "construct";
        case 3: return "to-alist";
        case 4: return "get";
        case 5: return "update";
    }
    return "?";
}

} // namespace ntup
