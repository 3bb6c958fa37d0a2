// shape.hpp - shape descriptors, the field table builder and the index resolver
#pragma once
#include "ntup/form.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ntup {

struct Field {
    std::string name;
    node_ptr default_expr; // escaped literal; cloned into every construction site
};

// Ordered, fixed-arity field layout. Immutable once built.
struct Shape {
    std::string name;
    std::vector<Field> fields;

    size_t arity() const { return fields.size(); }
    std::vector<std::string> field_names() const;
};

using ShapePtr = std::shared_ptr<const Shape>;

enum class Visibility { Public, Private };

// Normalize a raw field list into a shape.
//   fields: [ :date :time ]       bare atoms, default nil
//           [ [:x 0] [:y 0] ]     (name default) pairs
//           { :x 0 :y 0 }         association list
// kind ("deftuple"/"deftuplep") is only used in diagnostics.
// Throws non_atom_field_name, invalid_default_value, duplicate_field.
ShapePtr build_fields(const std::string& kind, const std::string& name, const node_ptr& fields);

// Check that a default can be embedded as a static literal; returns the reason when it cannot.
std::optional<std::string> escape_failure(const node_ptr& value);

// Zero-based position of `field`, first definition wins.
std::optional<size_t> resolve(const Shape& shape, const std::string& field);

} // namespace ntup
