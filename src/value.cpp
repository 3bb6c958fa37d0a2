#include "ntup/value.hpp"
#include <sstream>
#include <stdexcept>

namespace ntup {

Container::Container(): values_(std::make_shared<const std::vector<Value>>()) {}
Container::Container(std::vector<Value> values): values_(std::make_shared<const std::vector<Value>>(std::move(values))) {}

size_t Container::arity() const { return values_->size(); }

const Value& Container::get(size_t index) const {
    if(index >= values_->size()) throw std::out_of_range("tuple index " + std::to_string(index) + " out of range for size " + std::to_string(values_->size()));
    return (*values_)[index];
}

Container Container::with_replaced(size_t index, Value v) const {
    if(index >= values_->size()) throw std::out_of_range("tuple index " + std::to_string(index) + " out of range for size " + std::to_string(values_->size()));
    std::vector<Value> copy = *values_;
    copy[index] = std::move(v);
    return Container(std::move(copy));
}

const std::vector<Value>& Container::to_ordered_values() const { return *values_; }

AssocList::AssocList(): entries_(std::make_shared<const std::vector<std::pair<Value, Value>>>()) {}
AssocList::AssocList(std::vector<std::pair<Value, Value>> entries)
    : entries_(std::make_shared<const std::vector<std::pair<Value, Value>>>(std::move(entries))) {}

size_t AssocList::size() const { return entries_->size(); }
const std::vector<std::pair<Value, Value>>& AssocList::entries() const { return *entries_; }

const Value* AssocList::find(const std::string& key) const {
    for(auto &kv : *entries_){
        if(auto *a = std::get_if<Atom>(&kv.first.data); a && a->name == key) return &kv.second;
    }
    return nullptr;
}

Value v_tuple(std::vector<Value> elems){ return Value{ value_data{ Container(std::move(elems)) } }; }

Value v_alist(std::vector<std::pair<std::string, Value>> entries){
    std::vector<std::pair<Value, Value>> out; out.reserve(entries.size());
    for(auto &kv : entries) out.emplace_back(v_atom(kv.first), std::move(kv.second));
    return Value{ value_data{ AssocList(std::move(out)) } };
}

bool operator==(const Value& a, const Value& b){
    if(a.data.index() != b.data.index()) return false;
    struct V {
        const Value& b;
        bool operator()(std::monostate) const { return true; }
        bool operator()(bool x) const { return x == std::get<bool>(b.data); }
        bool operator()(int64_t x) const { return x == std::get<int64_t>(b.data); }
        bool operator()(double x) const { return x == std::get<double>(b.data); }
        bool operator()(const std::string& x) const { return x == std::get<std::string>(b.data); }
        bool operator()(const Atom& x) const { return x.name == std::get<Atom>(b.data).name; }
        bool operator()(const Container& x) const {
            const auto &l = x.to_ordered_values(); const auto &r = std::get<Container>(b.data).to_ordered_values();
            if(l.size() != r.size()) return false;
            for(size_t i=0;i<l.size();++i) if(l[i] != r[i]) return false;
            return true;
        }
        bool operator()(const AssocList& x) const {
            const auto &l = x.entries(); const auto &r = std::get<AssocList>(b.data).entries();
            if(l.size() != r.size()) return false;
            for(size_t i=0;i<l.size();++i) if(l[i].first != r[i].first || l[i].second != r[i].second) return false;
            return true;
        }
        bool operator()(const Tagged& x) const {
            const auto &y = std::get<Tagged>(b.data);
            return x.tag == y.tag && *x.inner == *y.inner;
        }
    };
    return std::visit(V{b}, a.data);
}

std::string inspect(const Value& v){
    struct V {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool x) const { return x ? "true" : "false"; }
        std::string operator()(int64_t x) const { return std::to_string(x); }
        std::string operator()(double x) const { std::ostringstream os; os << x; return os.str(); }
        std::string operator()(const std::string& s) const { return '"' + s + '"'; }
        std::string operator()(const Atom& a) const { return ':' + a.name; }
        std::string operator()(const Container& c) const {
            std::string out = "{"; bool first = true;
            for(auto &e : c.to_ordered_values()){ if(!first) out += ", "; first = false; out += inspect(e); }
            return out + "}";
        }
        std::string operator()(const AssocList& l) const {
            std::string out = "["; bool first = true;
            for(auto &kv : l.entries()){
                if(!first) out += ", "; first = false;
                if(auto *a = std::get_if<Atom>(&kv.first.data)) out += a->name + ": " + inspect(kv.second);
                else out += "{" + inspect(kv.first) + ", " + inspect(kv.second) + "}";
            }
            return out + "]";
        }
        std::string operator()(const Tagged& t) const { return "#" + t.tag + " " + inspect(*t.inner); }
    };
    return std::visit(V{}, v.data);
}

} // namespace ntup
