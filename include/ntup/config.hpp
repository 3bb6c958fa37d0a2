#pragma once
#include <cstdlib>
#include <string>

namespace ntup {

inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

struct ExpandOptions {
    bool trace = false;      // NTUP_TRACE_EXPAND: log each call-site classification to stderr
    bool diag_json = false;  // NTUP_DIAG_JSON: print diagnostics as JSON on stderr
    int max_depth = 256;     // NTUP_MAX_EXPAND_DEPTH: nested macro expansion limit
};

// Reads process env vars into ExpandOptions. Unset or malformed values keep the defaults.
ExpandOptions detect_options();

} // namespace ntup
