// reader.hpp - source text to forms
#pragma once
#include "ntup/form.hpp"
#include <string_view>
#include <vector>

namespace ntup {

// Read every top-level form in `src`. Throws ntup::parse_error with the failing line/column.
std::vector<node_ptr> parse_all(std::string_view src, std::string_view filename = "<input>");

// Read exactly one form.
node_ptr parse(std::string_view src, std::string_view filename = "<input>");

} // namespace ntup
