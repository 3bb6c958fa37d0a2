#include "ntup/convert.hpp"
#include "ntup/errors.hpp"

namespace ntup {

Value to_alist(const std::string& shape_name, const std::vector<std::string>& fields, const Value& value){
    const Container* tuple = value.as_tuple();
    if(!tuple){
        throw shape_mismatch(shape_name, fields.size(), inspect(value),
            "expected argument to be a literal atom, literal keyword or a :" + shape_name + " tuple, got runtime: " + inspect(value));
    }
    if(tuple->arity() != fields.size()){
        throw shape_mismatch(shape_name, fields.size(), inspect(value),
            "expected argument to be a :" + shape_name + " tuple of size " + std::to_string(fields.size()) + ", got: " + inspect(value));
    }
    std::vector<std::pair<Value, Value>> out; out.reserve(fields.size());
    const auto &vals = tuple->to_ordered_values();
    for(size_t i=0; i<fields.size(); ++i) out.emplace_back(v_atom(fields[i]), vals[i]);
    return Value{ value_data{ AssocList(std::move(out)) } };
}

} // namespace ntup
