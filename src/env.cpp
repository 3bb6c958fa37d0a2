#include "ntup/config.hpp"
#include <cstdlib>
#include <string>

namespace ntup {

ExpandOptions detect_options(){
    ExpandOptions o{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    o.trace = flag_enabled("NTUP_TRACE_EXPAND");
    o.diag_json = flag_enabled("NTUP_DIAG_JSON");

    if (const char* v = get("NTUP_MAX_EXPAND_DEPTH")) {
        char* end = nullptr;
        long n = std::strtol(v, &end, 10);
        if (end && *end == '\0' && n > 0) o.max_depth = static_cast<int>(n);
    }
    return o;
}

} // namespace ntup
