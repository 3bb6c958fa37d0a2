#include "ntup/shape.hpp"
#include "ntup/errors.hpp"
#include <unordered_set>

namespace ntup {

std::vector<std::string> Shape::field_names() const {
    std::vector<std::string> out; out.reserve(fields.size());
    for(auto &f : fields) out.push_back(f.name);
    return out;
}

std::optional<std::string> escape_failure(const node_ptr& value){
    if(!value) return std::string("missing value");
    const node& n = *value;
    if(is_symbol(n)) return "cannot escape variable reference " + to_string(n);
    if(is_list(n)){
        // calls are re-evaluated at every construction site; only their arguments must be closed
        auto &elems = std::get<list>(n.data).elems;
        for(size_t i=0; i<elems.size(); ++i){
            if(i == 0 && elems[i] && is_symbol(*elems[i])) continue;
            if(auto why = escape_failure(elems[i])) return why;
        }
    } else if(is_vector(n)){
        for(auto &e : std::get<vector_t>(n.data).elems) if(auto why = escape_failure(e)) return why;
    } else if(is_map(n)){
        for(auto &kv : std::get<map>(n.data).entries){
            if(auto why = escape_failure(kv.first)) return why;
            if(auto why = escape_failure(kv.second)) return why;
        }
    } else if(std::holds_alternative<tagged_value>(n.data)){
        return escape_failure(std::get<tagged_value>(n.data).inner);
    }
    return std::nullopt;
}

namespace {

struct FieldCollector {
    const std::string& kind;
    std::vector<Field> fields;
    std::unordered_set<std::string> seen;

    void add(const node_ptr& key, const node_ptr& value, const node_ptr& entry){
        auto *kw = key ? as_keyword(*key) : nullptr;
        if(!kw) throw non_atom_field_name(kind, to_string(entry));
        if(value){
            if(auto why = escape_failure(value)) throw invalid_default_value(kw->name, *why);
        }
        if(!seen.insert(kw->name).second) throw duplicate_field(kind, kw->name);
        fields.push_back(Field{ kw->name, value ? clone(value) : n_nil() });
    }
};

} // namespace

ShapePtr build_fields(const std::string& kind, const std::string& name, const node_ptr& raw){
    FieldCollector fc{kind, {}, {}};
    if(!raw) throw non_atom_field_name(kind, "nil");
    if(is_map(*raw)){
        for(auto &kv : std::get<map>(raw->data).entries){
            fc.add(kv.first, kv.second, node_vec({ kv.first, kv.second }));
        }
    } else if(is_vector(*raw)){
        for(auto &entry : std::get<vector_t>(raw->data).elems){
            if(entry && is_vector(*entry)){
                auto &pair = std::get<vector_t>(entry->data).elems;
                if(pair.size() != 2) throw non_atom_field_name(kind, to_string(entry));
                fc.add(pair[0], pair[1], entry);
            } else {
                fc.add(entry, nullptr, entry);
            }
        }
    } else {
        throw non_atom_field_name(kind, to_string(raw));
    }
    auto shape = std::make_shared<Shape>();
    shape->name = name;
    shape->fields = std::move(fc.fields);
    return shape;
}

std::optional<size_t> resolve(const Shape& shape, const std::string& field){
    for(size_t i=0; i<shape.fields.size(); ++i){
        if(shape.fields[i].name == field) return i;
    }
    return std::nullopt;
}

} // namespace ntup
