#pragma once
#include "ntup/form.hpp"
#include "ntup/errors.hpp"
#include <unordered_map>
#include <functional>
#include <optional>
#include <string>

namespace ntup {

// Expansion context threaded through every macro call.
struct ExpandEnv {
    bool in_match = false; // form sits in a pattern position (let binding, match? pattern)
    int depth = 0;         // nested macro rewrites so far
};

// Where a special form places its patterns.
enum class PatternSlot {
    FirstArg,      // (match? PAT expr)
    BindingVector, // (let [PAT expr PAT expr ...] body...)
};

// Macro expander over forms.
//
// Macros: signature std::optional<node_ptr>(const list& form, const ExpandEnv&)
//   Return std::nullopt if not applicable (allows arity-based conditional expansion).
//   The returned value is expanded again with the same env, so macros can expand to macros.
// The fallback macro is consulted for list heads with no registered macro; the expander
// uses it to route calls to shape names, which vary by module.
class Transformer {
public:
    using MacroFn = std::function<std::optional<node_ptr>(const list&, const ExpandEnv&)>;

    Transformer& add_macro(std::string name, MacroFn fn){ macros_[std::move(name)] = std::move(fn); return *this; }
    Transformer& add_pattern_form(std::string name, PatternSlot slot){ patterns_[std::move(name)] = slot; return *this; }
    Transformer& on_unknown_head(MacroFn fn){ fallback_ = std::move(fn); return *this; }
    Transformer& max_depth(int d){ max_depth_ = d; return *this; }

    // Expand macros (returns a deep-copied expanded value separate from input)
    node_ptr expand(const node_ptr& n, const ExpandEnv& env = {}){ return expand_impl(n, env); }

private:
    std::unordered_map<std::string, MacroFn> macros_;
    std::unordered_map<std::string, PatternSlot> patterns_;
    MacroFn fallback_{};
    int max_depth_ = 256;

    std::optional<node_ptr> apply_macro(const node_ptr& current, const ExpandEnv& env){
        auto& l = std::get<list>(current->data);
        if(l.elems.empty() || !std::holds_alternative<symbol>(l.elems[0]->data)) return std::nullopt;
        const auto& name = std::get<symbol>(l.elems[0]->data).name;
        auto it = macros_.find(name);
        if(it != macros_.end()) return it->second(l, env);
        if(fallback_) return fallback_(l, env);
        return std::nullopt;
    }

    node_ptr expand_impl(const node_ptr& n, const ExpandEnv& env){
        if(!n) return n;
        if(!std::holds_alternative<list>(n->data)) return clone_and_rewrite_children(n, env);
        std::optional<node_ptr> maybe;
        try {
            maybe = apply_macro(n, env);
        } catch(expand_error& e){
            e.locate(line(*n), col(*n));
            throw;
        }
        if(maybe){
            if(env.depth + 1 > max_depth_)
                throw expand_error(codes::ExpansionTooDeep, "macro expansion exceeded depth " + std::to_string(max_depth_) + " at " + head_name(*n), line(*n), col(*n));
            ExpandEnv inner = env; ++inner.depth;
            return expand_impl(*maybe, inner);
        }
        // expand children; pattern forms switch the context for their pattern slots
        auto out = std::make_shared<node>(); out->metadata = n->metadata;
        const auto& src = std::get<list>(n->data).elems;
        list l; l.elems.reserve(src.size());
        auto slot = patterns_.find(head_name(*n));
        for(size_t i=0; i<src.size(); ++i){
            if(slot != patterns_.end() && i == 1){
                if(slot->second == PatternSlot::FirstArg){ l.elems.push_back(expand_impl(src[i], with_match(env, true))); continue; }
                if(std::holds_alternative<vector_t>(src[i]->data)){ l.elems.push_back(expand_bindings(src[i], env)); continue; }
            }
            // everything outside a pattern slot of a pattern form is a plain expression
            l.elems.push_back(expand_impl(src[i], slot != patterns_.end() ? with_match(env, false) : env));
        }
        out->data = std::move(l);
        return out;
    }

    static ExpandEnv with_match(const ExpandEnv& env, bool m){ ExpandEnv e = env; e.in_match = m; return e; }

    node_ptr expand_bindings(const node_ptr& n, const ExpandEnv& env){
        auto copy = std::make_shared<node>(); copy->metadata = n->metadata;
        vector_t v; const auto& src = std::get<vector_t>(n->data).elems;
        for(size_t i=0; i<src.size(); ++i) v.elems.push_back(expand_impl(src[i], with_match(env, i % 2 == 0)));
        copy->data = std::move(v);
        return copy;
    }

    node_ptr clone_and_rewrite_children(const node_ptr& n, const ExpandEnv& env){
        if(std::holds_alternative<vector_t>(n->data)){
            auto copy = std::make_shared<node>(); copy->metadata = n->metadata; vector_t v; for(auto& c: std::get<vector_t>(n->data).elems) v.elems.push_back(expand_impl(c, env)); copy->data=std::move(v); return copy; }
        if(std::holds_alternative<map>(n->data)){
            auto copy = std::make_shared<node>(); copy->metadata=n->metadata; map m; for(auto& kv: std::get<map>(n->data).entries) m.entries.emplace_back(expand_impl(kv.first, env), expand_impl(kv.second, env)); copy->data=std::move(m); return copy; }
        if(std::holds_alternative<tagged_value>(n->data)){
            auto copy = std::make_shared<node>(); copy->metadata=n->metadata; auto& tv=std::get<tagged_value>(n->data); copy->data = tagged_value{ tv.tag, expand_impl(tv.inner, env) }; return copy; }
        return n; // atoms are immutable once read, sharing is fine
    }
};

} // namespace ntup
