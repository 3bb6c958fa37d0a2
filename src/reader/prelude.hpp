#pragma once
#include "ntup/form.hpp"
#include <string>
#include <vector>

namespace ntup::reader {

// Open collections while the grammar descends. The root frame collects top-level forms.
struct build_state {
    enum class kind { root, list, vector, map, tagged };
    struct frame {
        kind k{kind::root};
        int line{0};
        int col{0};
        std::string tag;
        std::vector<node_ptr> elems;
    };
    std::vector<frame> frames{ frame{} };

    void open(kind k, int line, int col){ frame f; f.k = k; f.line = line; f.col = col; frames.push_back(std::move(f)); }
    frame close(){ frame f = std::move(frames.back()); frames.pop_back(); return f; }
    void push(node_ptr n){ frames.back().elems.push_back(std::move(n)); }
    std::vector<node_ptr>& forms(){ return frames.front().elems; }
};

} // namespace ntup::reader
