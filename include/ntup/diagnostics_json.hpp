// diagnostics_json.hpp - JSON serialization for ExpandResult diagnostics
#pragma once
#include "ntup/diagnostics.hpp"
#include "ntup/config.hpp"
#include <string>

namespace ntup {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const ExpandResult& r);

// Print diagnostics JSON to stderr when opts.diag_json is set (NTUP_DIAG_JSON=1).
void maybe_print_json(const ExpandResult& r, const ExpandOptions& opts);

} // namespace ntup
