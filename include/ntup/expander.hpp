// expander.hpp - deftuple/deftuplep front end: module-scoped shape registry and program expansion
#pragma once
#include "ntup/form.hpp"
#include "ntup/shape.hpp"
#include "ntup/emitter.hpp"
#include "ntup/transform.hpp"
#include "ntup/diagnostics.hpp"
#include "ntup/config.hpp"
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ntup {

struct ShapeEntry {
    ShapePtr shape;
    Visibility visibility = Visibility::Public;
    std::string module;
};

// Shapes defined per module. A module sees its own shapes (public or private) and the public
// shapes of modules it imports.
class ShapeRegistry {
public:
    void define(const std::string& module, ShapePtr shape, Visibility vis);
    void add_import(const std::string& module, const std::string& imported);
    const ShapeEntry* lookup(const std::string& from_module, const std::string& name) const;
    // Whether `module` exports name/arity (only arities 0, 1 and 2 are generated).
    bool exported(const std::string& module, const std::string& name, int arity) const;
    size_t size() const;
private:
    std::map<std::string, std::unordered_map<std::string, ShapeEntry>> modules_;
    std::map<std::string, std::vector<std::string>> imports_;
};

class Expander {
public:
    explicit Expander(ExpandOptions opts = detect_options());
    Expander(ExpandOptions opts, std::unique_ptr<CodeEmitter> emitter);

    // Expand a whole program: (module :name M ...) forms and loose forms (module "user").
    // A failing definition or call site is reported and skipped; other forms still expand.
    ExpandResult expand_program(const std::vector<node_ptr>& forms);

    // Expand one expression in the scope of `module`. Throws expand_error.
    node_ptr expand_expr(const node_ptr& expr, const std::string& module = "user", bool in_match = false);

    // Programmatic equivalents of (deftuple :name fields) / (deftuplep :name fields).
    ShapePtr define_public(const std::string& module, const std::string& name, const node_ptr& fields);
    ShapePtr define_private(const std::string& module, const std::string& name, const node_ptr& fields);

    ShapeRegistry& registry(){ return registry_; }
    const ShapeRegistry& registry() const { return registry_; }

private:
    ExpandOptions opts_;
    std::unique_ptr<CodeEmitter> emitter_;
    ShapeRegistry registry_;
    Transformer tx_;
    std::string module_ = "user";

    void install_macros();
    std::optional<node_ptr> expand_call(const list& form, const ExpandEnv& env);
    ShapePtr define(const std::string& kind, const list& form);
    void expand_body(const std::vector<node_ptr>& body, size_t first, list& out, ExpandResult& result);
    void record(ExpandResult& result, const expand_error& e);
};

} // namespace ntup
