#include "ntup/expander.hpp"
#include "ntup/classify.hpp"
#include "ntup/errors.hpp"
#include <cstdio>

namespace ntup {

namespace {

// Module and shape names may be written as symbols, atoms or strings.
std::string name_of(const node_ptr& n){
    if(!n) return {};
    if(auto *s = as_symbol(*n)) return s->name;
    if(auto *k = as_keyword(*n)) return k->name;
    if(std::holds_alternative<std::string>(n->data)) return std::get<std::string>(n->data);
    return {};
}

// Heads the interpreter and expander own; a shape named after one would shadow it.
bool is_reserved_head(const std::string& name){
    static const char* const reserved[] = {
        "module", "import", "def", "do", "let", "match?", "=", "if", "try", "rescue", "raise",
        "deftuple", "deftuplep", "exported?",
    };
    for(const char* r : reserved) if(name == r) return true;
    return name.rfind("tuple/", 0) == 0 || name.rfind("alist/", 0) == 0;
}

ShapePtr checked_fields(const std::string& kind, const std::string& name, const node_ptr& fields){
    if(is_reserved_head(name)) throw reserved_shape_name(kind, name);
    return build_fields(kind, name, fields);
}

} // namespace

// ---- ShapeRegistry ----

void ShapeRegistry::define(const std::string& module, ShapePtr shape, Visibility vis){
    auto name = shape->name;
    modules_[module][name] = ShapeEntry{ std::move(shape), vis, module };
}

void ShapeRegistry::add_import(const std::string& module, const std::string& imported){
    auto &v = imports_[module];
    for(auto &m : v) if(m == imported) return;
    v.push_back(imported);
}

const ShapeEntry* ShapeRegistry::lookup(const std::string& from_module, const std::string& name) const {
    if(auto mit = modules_.find(from_module); mit != modules_.end()){
        if(auto it = mit->second.find(name); it != mit->second.end()) return &it->second;
    }
    auto iit = imports_.find(from_module);
    if(iit == imports_.end()) return nullptr;
    for(auto &imp : iit->second){
        auto mit = modules_.find(imp); if(mit == modules_.end()) continue;
        auto it = mit->second.find(name);
        if(it != mit->second.end() && it->second.visibility == Visibility::Public) return &it->second;
    }
    return nullptr;
}

bool ShapeRegistry::exported(const std::string& module, const std::string& name, int arity) const {
    if(arity < 0 || arity > 2) return false;
    auto mit = modules_.find(module); if(mit == modules_.end()) return false;
    auto it = mit->second.find(name);
    return it != mit->second.end() && it->second.visibility == Visibility::Public;
}

size_t ShapeRegistry::size() const {
    size_t n = 0; for(auto &m : modules_) n += m.second.size();
    return n;
}

// ---- Expander ----

Expander::Expander(ExpandOptions opts): Expander(opts, std::make_unique<FormEmitter>()) {}

Expander::Expander(ExpandOptions opts, std::unique_ptr<CodeEmitter> emitter)
    : opts_(opts), emitter_(std::move(emitter)) {
    install_macros();
}

void Expander::install_macros(){
    tx_.max_depth(opts_.max_depth);
    tx_.add_pattern_form("let", PatternSlot::BindingVector);
    tx_.add_pattern_form("match?", PatternSlot::FirstArg);

    auto misplaced = [](const std::string& kind){
        return [kind](const list&, const ExpandEnv&)->std::optional<node_ptr>{
            throw expand_error(codes::MisplacedDefinition, kind + " must be used at module level");
        };
    };
    tx_.add_macro("deftuple", misplaced("deftuple"));
    tx_.add_macro("deftuplep", misplaced("deftuplep"));

    // (exported? Module name arity) -> true/false, answered at expansion time
    tx_.add_macro("exported?", [this](const list& form, const ExpandEnv&)->std::optional<node_ptr>{
        auto &e = form.elems; if(e.size()!=4) return std::nullopt;
        if(!std::holds_alternative<int64_t>(e[3]->data)) return std::nullopt;
        auto mod = name_of(e[1]); auto name = name_of(e[2]);
        if(mod.empty() || name.empty()) return std::nullopt;
        return with_pos_of(n_bool(registry_.exported(mod, name, (int)std::get<int64_t>(e[3]->data))), *e[0]);
    });

    tx_.on_unknown_head([this](const list& form, const ExpandEnv& env){ return expand_call(form, env); });
}

std::optional<node_ptr> Expander::expand_call(const list& form, const ExpandEnv& env){
    const std::string& name = std::get<symbol>(form.elems[0]->data).name;
    const ShapeEntry* entry = registry_.lookup(module_, name);
    if(!entry) return std::nullopt;
    CallSite site = classify(form);
    node_ptr out = dispatch(*emitter_, *entry->shape, site, env,
                            [this](const node_ptr& n, const ExpandEnv& e){ return tx_.expand(n, e); });
    if(opts_.trace){
        std::fprintf(stderr, "[dbg][expand] %s:%d:%d %s/%s%s -> %s\n", module_.c_str(), line(*form.elems[0]), col(*form.elems[0]),
                     name.c_str(), callsite_name(site), env.in_match ? " (match)" : "", to_string(out).c_str());
    }
    return with_pos_of(out, *form.elems[0]);
}

ShapePtr Expander::define(const std::string& kind, const list& form){
    auto &e = form.elems;
    if(e.size()!=3 || !as_keyword(*e[1]))
        throw expand_error(codes::InvalidArgumentShape, kind + " expects an atom name and a field list, got: " + to_string(node{ form, {} }));
    const std::string& name = std::get<keyword>(e[1]->data).name;
    auto shape = checked_fields(kind, name, e[2]);
    registry_.define(module_, shape, kind == "deftuplep" ? Visibility::Private : Visibility::Public);
    if(opts_.trace) std::fprintf(stderr, "[dbg][define] %s %s.%s arity=%zu\n", kind.c_str(), module_.c_str(), name.c_str(), shape->arity());
    return shape;
}

ShapePtr Expander::define_public(const std::string& module, const std::string& name, const node_ptr& fields){
    auto shape = checked_fields("deftuple", name, fields);
    registry_.define(module, shape, Visibility::Public);
    return shape;
}

ShapePtr Expander::define_private(const std::string& module, const std::string& name, const node_ptr& fields){
    auto shape = checked_fields("deftuplep", name, fields);
    registry_.define(module, shape, Visibility::Private);
    return shape;
}

void Expander::record(ExpandResult& result, const expand_error& e){
    result.success = false;
    result.errors.push_back(to_diagnostic(e));
    if(opts_.trace) std::fprintf(stderr, "[dbg][expand][error] %s %s\n", e.code().c_str(), e.what());
}

void Expander::expand_body(const std::vector<node_ptr>& body, size_t first, list& out, ExpandResult& result){
    for(size_t i=first; i<body.size(); ++i){
        const node_ptr& form = body[i];
        try {
            std::string head = form ? head_name(*form) : std::string();
            if(head == "deftuple" || head == "deftuplep"){
                define(head, std::get<list>(form->data));
                continue;
            }
            if(head == "import"){
                auto &l = std::get<list>(form->data).elems;
                for(size_t k=1; k<l.size(); ++k){ auto m = name_of(l[k]); if(!m.empty()) registry_.add_import(module_, m); }
                out.elems.push_back(form);
                continue;
            }
            out.elems.push_back(tx_.expand(form, ExpandEnv{}));
        } catch(expand_error& e){
            if(form) e.locate(line(*form), col(*form));
            record(result, e);
        }
    }
}

ExpandResult Expander::expand_program(const std::vector<node_ptr>& forms){
    ExpandResult result;
    for(auto &top : forms){
        if(top && head_name(*top) == "module"){
            auto &elems = std::get<list>(top->data).elems;
            list mod; mod.elems.push_back(elems[0]);
            module_ = "user";
            size_t i = 1;
            while(i+1<elems.size() && elems[i] && is_keyword(*elems[i])){
                if(std::get<keyword>(elems[i]->data).name == "name") module_ = name_of(elems[i+1]);
                mod.elems.push_back(elems[i]); mod.elems.push_back(elems[i+1]); i += 2;
            }
            expand_body(elems, i, mod, result);
            auto out = std::make_shared<node>(node{ std::move(mod), top->metadata });
            result.forms.push_back(out);
            continue;
        }
        module_ = "user";
        list loose;
        expand_body({ top }, 0, loose, result);
        for(auto &f : loose.elems) result.forms.push_back(f);
    }
    module_ = "user";
    return result;
}

node_ptr Expander::expand_expr(const node_ptr& expr, const std::string& module, bool in_match){
    module_ = module;
    ExpandEnv env; env.in_match = in_match;
    return tx_.expand(expr, env);
}

} // namespace ntup
