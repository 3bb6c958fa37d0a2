// classify.hpp - call-site classification for (name ...) forms
#pragma once
#include "ntup/form.hpp"
#include "ntup/emitter.hpp"
#include "ntup/transform.hpp"
#include <functional>
#include <string>
#include <variant>

namespace ntup {

namespace callsite {
struct Empty {};                                           // (name)
struct SingleFieldName { std::string field; };             // (name :f)
struct SingleAssocList { AssocEntries entries; };          // (name {:f v})
struct SingleOpaque { node_ptr expr; };                    // (name <expr>)
struct GetField { node_ptr container; std::string field; };         // (name t :f)
struct UpdateFields { node_ptr container; AssocEntries entries; };  // (name t {:f v})
}

using CallSite = std::variant<callsite::Empty, callsite::SingleFieldName, callsite::SingleAssocList,
                              callsite::SingleOpaque, callsite::GetField, callsite::UpdateFields>;

// True for a {...} literal whose keys are all atoms (the empty literal included).
bool is_assoc_literal(const node& n);

// Classify the arguments of a (name args...) form by syntactic shape alone.
// Throws invalid_argument_shape for a two-argument call whose second argument is neither an
// atom nor an association list, and for more than two arguments.
CallSite classify(const list& form);

// Route a classified call site to the emitter. `expand` is used to macro-expand an opaque
// single argument before checking whether it is statically a tuple of the shape's arity.
node_ptr dispatch(CodeEmitter& emitter, const Shape& shape, const CallSite& site, const ExpandEnv& env,
                  const std::function<node_ptr(const node_ptr&, const ExpandEnv&)>& expand);

// Short tag for traces: "construct", "index", ...
const char* callsite_name(const CallSite& site);

} // namespace ntup
