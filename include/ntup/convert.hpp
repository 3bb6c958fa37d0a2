// convert.hpp - run-time tuple -> association list conversion
#pragma once
#include "ntup/shape.hpp"
#include "ntup/value.hpp"
#include <string>
#include <vector>

namespace ntup {

// Zip `fields` with the values of a tuple of the same arity.
// Throws shape_mismatch when `value` is not a tuple, or is a tuple of another arity.
Value to_alist(const std::string& shape_name, const std::vector<std::string>& fields, const Value& value);
inline Value to_alist(const Shape& shape, const Value& value){ return to_alist(shape.name, shape.field_names(), value); }

} // namespace ntup
