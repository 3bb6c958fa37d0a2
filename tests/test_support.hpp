#pragma once
// Helpers shared by the test executables.
#include "ntup/reader.hpp"
#include "ntup/expander.hpp"
#include "ntup/interp.hpp"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ntup::test {

inline ExpandResult expand_source(const std::string& src){
    Expander ex{ExpandOptions{}};
    return ex.expand_program(parse_all(src, "test"));
}

// Expand and evaluate a program; an expansion failure is rethrown as std::runtime_error.
inline Value run_program(const std::string& src){
    ExpandResult res = expand_source(src);
    if(!res.success) throw std::runtime_error(res.errors.front().code + ": " + res.errors.front().message);
    Interpreter in;
    return in.run(res.forms);
}

// Printed expansion of one expression.
inline std::string expand_str(Expander& ex, const std::string& src, bool in_match = false){
    return to_string(ex.expand_expr(parse(src), "user", in_match));
}

// Sets (or unsets, when value is null) an environment variable until scope exit.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value): name_(name) {
        if(const char* old = std::getenv(name)){ had_ = true; old_ = old; }
        if(value) ::setenv(name, value, 1); else ::unsetenv(name);
    }
    ~ScopedEnv(){ if(had_) ::setenv(name_.c_str(), old_.c_str(), 1); else ::unsetenv(name_.c_str()); }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::string old_;
    bool had_ = false;
};

} // namespace ntup::test
