// emitter.hpp - code generation for the six call shapes of a named tuple
#pragma once
#include "ntup/form.hpp"
#include "ntup/shape.hpp"
#include <utility>
#include <vector>

namespace ntup {

using AssocEntries = std::vector<std::pair<node_ptr, node_ptr>>; // (:key value) in source order

// One method per call shape. Implementations return the form that replaces the call site
// and throw expand_error subclasses for invalid uses.
class CodeEmitter {
public:
    virtual ~CodeEmitter() = default;
    // (name)
    virtual node_ptr construct_defaults(const Shape& shape, bool in_match) = 0;
    // (name :field)
    virtual node_ptr field_index(const Shape& shape, const std::string& field) = 0;
    // (name {:field v ...})
    virtual node_ptr construct(const Shape& shape, const AssocEntries& overrides, bool in_match) = 0;
    // (name tuple); literal_elems is set when the argument is statically a tuple of the shape's arity
    virtual node_ptr to_alist(const Shape& shape, const node_ptr& tuple_expr, const std::vector<node_ptr>* literal_elems) = 0;
    // (name tuple :field)
    virtual node_ptr get_field(const Shape& shape, const node_ptr& tuple_expr, const std::string& field) = 0;
    // (name tuple {:field v ...})
    virtual node_ptr update(const Shape& shape, const node_ptr& tuple_expr, const AssocEntries& overrides, bool in_match) = 0;
};

// Emits host forms:
//   construct -> [v0 v1 ...]            (pattern context: unspecified fields become _)
//   index     -> <int>
//   get       -> (tuple/elem t i)
//   update    -> (tuple/put (tuple/put t i v) j w)
//   to_alist  -> {:f0 v0 ...} for literal tuples, else (tuple/to-alist :shape [:f0 ...] t)
class FormEmitter : public CodeEmitter {
public:
    node_ptr construct_defaults(const Shape& shape, bool in_match) override;
    node_ptr field_index(const Shape& shape, const std::string& field) override;
    node_ptr construct(const Shape& shape, const AssocEntries& overrides, bool in_match) override;
    node_ptr to_alist(const Shape& shape, const node_ptr& tuple_expr, const std::vector<node_ptr>* literal_elems) override;
    node_ptr get_field(const Shape& shape, const node_ptr& tuple_expr, const std::string& field) override;
    node_ptr update(const Shape& shape, const node_ptr& tuple_expr, const AssocEntries& overrides, bool in_match) override;
};

// Apply the construction-only wildcard rule: when overrides contain (:_ D), every shape field not
// explicitly overridden is given value D and all :_ entries are dropped. Overrides are otherwise
// returned unchanged (duplicates included).
AssocEntries apply_wildcard(const Shape& shape, const AssocEntries& overrides);

} // namespace ntup
