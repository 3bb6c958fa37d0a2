// value.hpp - run-time values: immutable tag-less tuples and association lists
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ntup {

struct Value;

struct Atom { std::string name; };

// Fixed-arity heterogeneous tuple with no embedded tag. Storage is shared and never mutated;
// with_replaced() copies.
class Container {
public:
    Container();
    explicit Container(std::vector<Value> values);

    size_t arity() const;
    const Value& get(size_t index) const;  // throws std::out_of_range
    Container with_replaced(size_t index, Value v) const;  // throws std::out_of_range
    const std::vector<Value>& to_ordered_values() const;

private:
    std::shared_ptr<const std::vector<Value>> values_;
};

// Ordered (key, value) pairs; keys are usually atoms.
class AssocList {
public:
    AssocList();
    explicit AssocList(std::vector<std::pair<Value, Value>> entries);

    size_t size() const;
    const std::vector<std::pair<Value, Value>>& entries() const;
    // First value stored under atom `key`, or nullptr.
    const Value* find(const std::string& key) const;

private:
    std::shared_ptr<const std::vector<std::pair<Value, Value>>> entries_;
};

struct Tagged { std::string tag; std::shared_ptr<const Value> inner; };

using value_data = std::variant<std::monostate, bool, int64_t, double, std::string, Atom, Container, AssocList, Tagged>;

struct Value {
    value_data data;

    Value() = default;
    Value(value_data d): data(std::move(d)) {}

    bool is_nil() const { return std::holds_alternative<std::monostate>(data); }
    bool truthy() const { return !is_nil() && !(std::holds_alternative<bool>(data) && !std::get<bool>(data)); }
    const Container* as_tuple() const { return std::get_if<Container>(&data); }
    const AssocList* as_alist() const { return std::get_if<AssocList>(&data); }
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b){ return !(a == b); }

// Printed form used in diagnostics: tuples as {1, 2}, association lists as [x: 1, y: 2].
std::string inspect(const Value& v);

// Convenience constructors
inline Value v_nil(){ return Value{}; }
inline Value v_int(int64_t i){ return Value{ value_data{i} }; }
inline Value v_bool(bool b){ return Value{ value_data{b} }; }
inline Value v_str(std::string s){ return Value{ value_data{std::move(s)} }; }
inline Value v_atom(std::string s){ return Value{ value_data{Atom{std::move(s)}} }; }
Value v_tuple(std::vector<Value> elems);
Value v_alist(std::vector<std::pair<std::string, Value>> entries);

} // namespace ntup
