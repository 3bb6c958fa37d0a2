#include "ntup/interp.hpp"
#include "ntup/convert.hpp"
#include "ntup/errors.hpp"
#include <stdexcept>

namespace ntup {

namespace {

Value literal_value(const node& n){
    if(std::holds_alternative<bool>(n.data)) return v_bool(std::get<bool>(n.data));
    if(std::holds_alternative<int64_t>(n.data)) return v_int(std::get<int64_t>(n.data));
    if(std::holds_alternative<double>(n.data)) return Value{ value_data{ std::get<double>(n.data) } };
    if(std::holds_alternative<std::string>(n.data)) return v_str(std::get<std::string>(n.data));
    if(auto *k = as_keyword(n)) return v_atom(k->name);
    return v_nil();
}

void expect_arity(const list& l, size_t n, const std::string& op){
    if(l.elems.size() != n + 1)
        throw eval_error(codes::BadOperand, op + " expects " + std::to_string(n) + " operand(s), got " + std::to_string(l.elems.size() - 1));
}

const Container& expect_tuple(const Value& v, const std::string& op){
    if(auto *t = v.as_tuple()) return *t;
    throw eval_error(codes::BadOperand, op + " expects a tuple, got: " + inspect(v));
}

size_t expect_index(const Value& v, const std::string& op){
    if(auto *i = std::get_if<int64_t>(&v.data); i && *i >= 0) return static_cast<size_t>(*i);
    throw eval_error(codes::BadOperand, op + " expects a non-negative integer index, got: " + inspect(v));
}

} // namespace

Value Interpreter::run(const std::vector<node_ptr>& forms){
    Value last;
    for(auto &f : forms){
        if(f && head_name(*f) == "module"){ last = eval_module(std::get<list>(f->data)); continue; }
        module_ = "user";
        last = eval(f, "user");
    }
    module_ = "user";
    return last;
}

Value Interpreter::eval_module(const list& l){
    size_t i = 1;
    module_ = "user";
    while(i+1 < l.elems.size() && is_keyword(*l.elems[i])){
        if(std::get<keyword>(l.elems[i]->data).name == "name"){
            const node& nm = *l.elems[i+1];
            if(auto *s = as_symbol(nm)) module_ = s->name;
            else if(auto *k = as_keyword(nm)) module_ = k->name;
            else if(std::holds_alternative<std::string>(nm.data)) module_ = std::get<std::string>(nm.data);
        }
        i += 2;
    }
    Value last;
    Scope top;
    for(; i < l.elems.size(); ++i) last = eval_in(l.elems[i], top);
    return last;
}

Value Interpreter::eval(const node_ptr& expr, const std::string& module){
    module_ = module;
    Scope top;
    return eval_in(expr, top);
}

const Value* Interpreter::global(const std::string& module, const std::string& name) const {
    auto mit = globals_.find(module); if(mit == globals_.end()) return nullptr;
    auto it = mit->second.find(name);
    return it == mit->second.end() ? nullptr : &it->second;
}

const Value* Interpreter::lookup(const std::string& name, const Scope& scope) const {
    for(const Scope* s = &scope; s; s = s->parent){
        auto it = s->vars.find(name);
        if(it != s->vars.end()) return &it->second;
    }
    return global(module_, name);
}

Value Interpreter::eval_in(const node_ptr& n, Scope& scope){
    if(!n) return v_nil();
    if(auto *s = as_symbol(*n)){
        if(const Value* v = lookup(s->name, scope)) return *v;
        throw eval_error(codes::UnboundVariable, "undefined variable " + s->name);
    }
    if(is_vector(*n)){
        std::vector<Value> vals;
        for(auto &e : std::get<vector_t>(n->data).elems) vals.push_back(eval_in(e, scope));
        return v_tuple(std::move(vals));
    }
    if(is_map(*n)){
        std::vector<std::pair<Value, Value>> entries;
        for(auto &kv : std::get<map>(n->data).entries) entries.emplace_back(eval_in(kv.first, scope), eval_in(kv.second, scope));
        return Value{ value_data{ AssocList(std::move(entries)) } };
    }
    if(std::holds_alternative<tagged_value>(n->data)){
        auto &tv = std::get<tagged_value>(n->data);
        return Value{ value_data{ Tagged{ tv.tag.name, std::make_shared<const Value>(eval_in(tv.inner, scope)) } } };
    }
    if(is_list(*n)) return call(std::get<list>(n->data), scope);
    return literal_value(*n);
}

Value Interpreter::call(const list& l, Scope& scope){
    if(l.elems.empty()) return v_nil();
    auto *head = as_symbol(*l.elems[0]);
    if(!head) throw eval_error(codes::UndefinedFunction, "cannot call " + to_string(node{ l, {} }));
    const std::string& op = head->name;

    if(op == "do"){ Value last; for(size_t i=1;i<l.elems.size();++i) last = eval_in(l.elems[i], scope); return last; }
    if(op == "import") return v_nil();
    if(op == "module") return eval_module(l);
    if(op == "def"){
        expect_arity(l, 2, op);
        auto *name = as_symbol(*l.elems[1]);
        if(!name) throw eval_error(codes::BadOperand, "def expects a symbol, got: " + to_string(l.elems[1]));
        Value v = eval_in(l.elems[2], scope);
        globals_[module_][name->name] = v;
        return v;
    }
    if(op == "let") return eval_let(l, scope);
    if(op == "match?"){
        expect_arity(l, 2, op);
        Value v = eval_in(l.elems[2], scope);
        Bindings b;
        return v_bool(match(l.elems[1], v, b));
    }
    if(op == "="){ expect_arity(l, 2, op); return v_bool(eval_in(l.elems[1], scope) == eval_in(l.elems[2], scope)); }
    if(op == "if"){
        if(l.elems.size() != 3 && l.elems.size() != 4) throw eval_error(codes::BadOperand, "if expects a condition and one or two branches");
        if(eval_in(l.elems[1], scope).truthy()) return eval_in(l.elems[2], scope);
        return l.elems.size() == 4 ? eval_in(l.elems[3], scope) : v_nil();
    }
    if(op == "try") return eval_try(l, scope);
    if(op == "raise"){
        expect_arity(l, 1, op);
        Value m = eval_in(l.elems[1], scope);
        auto *s = std::get_if<std::string>(&m.data);
        throw eval_error(codes::Raised, s ? *s : inspect(m));
    }
    if(op == "tuple/elem"){
        expect_arity(l, 2, op);
        Value t = eval_in(l.elems[1], scope);
        size_t i = expect_index(eval_in(l.elems[2], scope), op);
        try { return expect_tuple(t, op).get(i); }
        catch(const std::out_of_range& e){ throw eval_error(codes::BadOperand, e.what()); }
    }
    if(op == "tuple/put"){
        expect_arity(l, 3, op);
        Value t = eval_in(l.elems[1], scope);
        size_t i = expect_index(eval_in(l.elems[2], scope), op);
        Value v = eval_in(l.elems[3], scope);
        try { return Value{ value_data{ expect_tuple(t, op).with_replaced(i, std::move(v)) } }; }
        catch(const std::out_of_range& e){ throw eval_error(codes::BadOperand, e.what()); }
    }
    if(op == "tuple/size"){
        expect_arity(l, 1, op);
        return v_int(static_cast<int64_t>(expect_tuple(eval_in(l.elems[1], scope), op).arity()));
    }
    if(op == "tuple/to-alist"){
        // (tuple/to-alist :shape [:f0 :f1 ...] <expr>); shape and field names are literal
        expect_arity(l, 3, op);
        auto *shape = as_keyword(*l.elems[1]);
        if(!shape || !is_vector(*l.elems[2])) throw eval_error(codes::BadOperand, op + " expects a literal shape name and field vector");
        std::vector<std::string> fields;
        for(auto &f : std::get<vector_t>(l.elems[2]->data).elems){
            auto *k = as_keyword(*f);
            if(!k) throw eval_error(codes::BadOperand, op + " field names must be atoms, got: " + to_string(f));
            fields.push_back(k->name);
        }
        return to_alist(shape->name, fields, eval_in(l.elems[3], scope));
    }
    if(op == "alist/get"){
        expect_arity(l, 2, op);
        Value al = eval_in(l.elems[1], scope);
        Value key = eval_in(l.elems[2], scope);
        auto *a = al.as_alist();
        if(!a) throw eval_error(codes::BadOperand, op + " expects an association list, got: " + inspect(al));
        for(auto &kv : a->entries()) if(kv.first == key) return kv.second;
        return v_nil();
    }
    throw eval_error(codes::UndefinedFunction, "undefined function " + op + "/" + std::to_string(l.elems.size() - 1));
}

Value Interpreter::eval_let(const list& l, Scope& scope){
    if(l.elems.size() < 2 || !is_vector(*l.elems[1])) throw eval_error(codes::BadOperand, "let expects a binding vector");
    const auto &binds = std::get<vector_t>(l.elems[1]->data).elems;
    if(binds.size() % 2) throw eval_error(codes::BadOperand, "let binding vector needs pattern/value pairs");
    Scope inner; inner.parent = &scope;
    for(size_t i=0; i<binds.size(); i+=2){
        Value v = eval_in(binds[i+1], inner);
        Bindings b;
        if(!match(binds[i], v, b)) throw eval_error(codes::MatchFailed, "no match of right hand side value: " + inspect(v));
        for(auto &kv : b) inner.vars[kv.first] = kv.second;
    }
    Value last;
    for(size_t i=2; i<l.elems.size(); ++i) last = eval_in(l.elems[i], inner);
    return last;
}

Value Interpreter::eval_try(const list& l, Scope& scope){
    // (try expr (rescue e handler...))
    if(l.elems.size() != 3 || head_name(*l.elems[2]) != "rescue") throw eval_error(codes::BadOperand, "try expects an expression and a (rescue e ...) clause");
    const auto &rescue = std::get<list>(l.elems[2]->data).elems;
    if(rescue.size() < 2 || !as_symbol(*rescue[1])) throw eval_error(codes::BadOperand, "rescue expects a variable name");
    try {
        return eval_in(l.elems[1], scope);
    } catch(const eval_error& err){
        Scope inner; inner.parent = &scope;
        inner.vars[std::get<symbol>(rescue[1]->data).name] = v_str(err.what());
        Value last;
        for(size_t i=2; i<rescue.size(); ++i) last = eval_in(rescue[i], inner);
        return last;
    }
}

bool Interpreter::matches(const node_ptr& pattern, const Value& v) const {
    Bindings b;
    return match(pattern, v, b);
}

bool Interpreter::match(const node_ptr& pat, const Value& v, Bindings& out) const {
    if(!pat) return false;
    if(auto *s = as_symbol(*pat)){
        if(!s->name.empty() && s->name[0] == '_') return true; // wildcard, binds nothing
        auto it = out.find(s->name);
        if(it != out.end()) return it->second == v;
        out[s->name] = v;
        return true;
    }
    if(is_vector(*pat)){
        auto *t = v.as_tuple(); if(!t) return false;
        const auto &ps = std::get<vector_t>(pat->data).elems;
        if(ps.size() != t->arity()) return false;
        for(size_t i=0;i<ps.size();++i) if(!match(ps[i], t->get(i), out)) return false;
        return true;
    }
    if(is_map(*pat)){
        auto *a = v.as_alist(); if(!a) return false;
        const auto &ps = std::get<map>(pat->data).entries;
        if(ps.size() != a->size()) return false;
        for(size_t i=0;i<ps.size();++i){
            if(!match(ps[i].first, a->entries()[i].first, out) || !match(ps[i].second, a->entries()[i].second, out)) return false;
        }
        return true;
    }
    if(std::holds_alternative<tagged_value>(pat->data)){
        auto *t = std::get_if<Tagged>(&v.data); auto &tv = std::get<tagged_value>(pat->data);
        return t && t->tag == tv.tag.name && match(tv.inner, *t->inner, out);
    }
    if(is_list(*pat)) throw eval_error(codes::BadOperand, "invalid pattern: " + to_string(pat));
    return literal_value(*pat) == v;
}

} // namespace ntup
