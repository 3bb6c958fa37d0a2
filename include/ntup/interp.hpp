// interp.hpp - evaluator for expanded programs
#pragma once
#include "ntup/form.hpp"
#include "ntup/value.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace ntup {

// Evaluates fully expanded forms. Shape calls must already be expanded away; anything left
// that is not a special form or tuple primitive is an undefined function at run time.
//
// Special forms: module import def do let match? = if try raise
// Primitives:    tuple/elem tuple/put tuple/size tuple/to-alist alist/get
class Interpreter {
public:
    // Evaluate expanded top-level forms in order; returns the value of the last one.
    Value run(const std::vector<node_ptr>& forms);
    // Evaluate one expanded expression with `module` globals in scope.
    Value eval(const node_ptr& expr, const std::string& module = "user");
    // Pattern test without keeping bindings.
    bool matches(const node_ptr& pattern, const Value& v) const;

    const Value* global(const std::string& module, const std::string& name) const;

private:
    using Bindings = std::unordered_map<std::string, Value>;
    struct Scope { Bindings vars; const Scope* parent = nullptr; };

    std::unordered_map<std::string, Bindings> globals_;
    std::string module_ = "user";

    Value eval_module(const list& l);
    Value eval_in(const node_ptr& n, Scope& scope);
    Value call(const list& l, Scope& scope);
    Value eval_let(const list& l, Scope& scope);
    Value eval_try(const list& l, Scope& scope);
    bool match(const node_ptr& pat, const Value& v, Bindings& out) const;
    const Value* lookup(const std::string& name, const Scope& scope) const;
};

} // namespace ntup
