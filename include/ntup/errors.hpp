// errors.hpp - exception taxonomy for reading, expansion and evaluation
#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstddef>

namespace ntup {

struct parse_error : std::runtime_error {
    parse_error(const std::string& msg, int line=-1, int col=-1): std::runtime_error(msg), line(line), col(col) {}
    int line;
    int col;
};

// Stable diagnostic codes. E20xx are expansion (build time) failures, E21xx run time.
namespace codes {
inline constexpr const char* NonAtomFieldName = "E2001";
inline constexpr const char* InvalidDefaultValue = "E2002";
inline constexpr const char* UnknownField = "E2003";
inline constexpr const char* InvalidArgumentShape = "E2004";
inline constexpr const char* UpdateInMatchContext = "E2005";
inline constexpr const char* DuplicateField = "E2006";
inline constexpr const char* ExpansionTooDeep = "E2007";
inline constexpr const char* MisplacedDefinition = "E2008";
inline constexpr const char* ReservedShapeName = "E2009";
inline constexpr const char* ShapeMismatch = "E2101";
inline constexpr const char* UnboundVariable = "E2102";
inline constexpr const char* MatchFailed = "E2103";
inline constexpr const char* UndefinedFunction = "E2104";
inline constexpr const char* BadOperand = "E2105";
inline constexpr const char* Raised = "E2106";
}

// Build-time failure: aborts expansion of the current definition or call site.
class expand_error : public std::runtime_error {
public:
    expand_error(std::string code, const std::string& msg, int line=-1, int col=-1)
        : std::runtime_error(msg), code_(std::move(code)), line_(line), col_(col) {}
    const std::string& code() const noexcept { return code_; }
    int line() const noexcept { return line_; }
    int col() const noexcept { return col_; }
    // Call sites attach their position when the thrower had none.
    void locate(int line, int col){ if(line_ < 0){ line_ = line; col_ = col; } }
private:
    std::string code_;
    int line_;
    int col_;
};

struct non_atom_field_name : expand_error {
    non_atom_field_name(const std::string& kind, const std::string& given)
        : expand_error(codes::NonAtomFieldName, kind + " fields must be atoms, got: " + given), given(given) {}
    std::string given;
};

struct invalid_default_value : expand_error {
    invalid_default_value(const std::string& field, const std::string& cause)
        : expand_error(codes::InvalidDefaultValue, "invalid value for tuple field " + field + ", " + cause), field(field) {}
    std::string field;
};

struct duplicate_field : expand_error {
    duplicate_field(const std::string& kind, const std::string& field)
        : expand_error(codes::DuplicateField, kind + " field :" + field + " is defined more than once"), field(field) {}
    std::string field;
};

struct unknown_field : expand_error {
    unknown_field(const std::string& shape, const std::string& field, std::vector<std::string> known = {})
        : expand_error(codes::UnknownField, "tuple :" + shape + " does not have the key: :" + field), shape(shape), field(field), known(std::move(known)) {}
    std::string shape;
    std::string field;
    std::vector<std::string> known; // shape fields, for suggestions
};

struct invalid_argument_shape : expand_error {
    explicit invalid_argument_shape(const std::string& printed)
        : expand_error(codes::InvalidArgumentShape, "expected arguments to be a compile time atom or keywords, got: " + printed) {}
};

struct reserved_shape_name : expand_error {
    reserved_shape_name(const std::string& kind, const std::string& name)
        : expand_error(codes::ReservedShapeName, kind + " cannot define :" + name + ", the name is a special form"), name(name) {}
    std::string name;
};

struct update_in_match_context : expand_error {
    update_in_match_context()
        : expand_error(codes::UpdateInMatchContext, "cannot invoke update style macro inside match") {}
};

// Run-time failure raised by evaluated code; recoverable with (try ... (rescue e ...)).
class eval_error : public std::runtime_error {
public:
    eval_error(std::string code, const std::string& msg): std::runtime_error(msg), code_(std::move(code)) {}
    const std::string& code() const noexcept { return code_; }
private:
    std::string code_;
};

struct shape_mismatch : eval_error {
    shape_mismatch(const std::string& shape, size_t expected_arity, const std::string& actual, const std::string& msg)
        : eval_error(codes::ShapeMismatch, msg), shape(shape), expected_arity(expected_arity), actual(actual) {}
    std::string shape;
    size_t expected_arity;
    std::string actual; // printed form of the received value
};

} // namespace ntup
