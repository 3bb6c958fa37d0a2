// A heterogeneous table of tag-less tuples keyed by shape name.
// Each row is stored as a bare tuple; the shape is kept beside it, never inside it.
#include "ntup/reader.hpp"
#include "ntup/expander.hpp"
#include "ntup/interp.hpp"
#include "ntup/convert.hpp"
#include <iostream>
#include <map>
#include <vector>

using namespace ntup;

int main(){
    const char* program = R"((module :name Inventory
  (deftuple :item {:sku "" :qty 0 :price 0.0})
  (deftuple :location [:aisle :shelf])
  (def rows [(item {:sku "A-1" :qty 4})
             (item {:sku "B-7" :qty 12 :price 2.5})
             (location {:aisle 3 :shelf 1})
             (item (item {:sku "C-2"}) {:qty 1})])
  (def tags [:item :item :location :item]))
)";

    Expander expander;
    ExpandResult res = expander.expand_program(parse_all(program, "inventory"));
    if(!res.success){
        for(auto &d : res.errors) std::cerr << "error[" << d.code << "]: " << d.message << "\n";
        return 2;
    }
    Interpreter interp;
    try {
        interp.run(res.forms);
    } catch(const eval_error& e){
        std::cerr << "runtime error[" << e.code() << "]: " << e.what() << "\n";
        return 3;
    }

    const Value* rows = interp.global("Inventory", "rows");
    const Value* tags = interp.global("Inventory", "tags");
    if(!rows || !tags || !rows->as_tuple() || !tags->as_tuple()){ std::cerr << "table not defined\n"; return 4; }

    std::map<std::string, std::vector<Value>> by_shape;
    for(size_t i=0; i<rows->as_tuple()->arity(); ++i){
        auto &tag = std::get<Atom>(tags->as_tuple()->get(i).data).name;
        by_shape[tag].push_back(rows->as_tuple()->get(i));
    }
    for(auto &kv : by_shape){
        const ShapeEntry* entry = expander.registry().lookup("Inventory", kv.first);
        if(!entry) continue;
        std::cout << kv.first << " (" << entry->shape->arity() << " fields)\n";
        for(auto &row : kv.second) std::cout << "  " << inspect(to_alist(*entry->shape, row)) << "\n";
    }
    return 0;
}
