#pragma once
#include "prelude.hpp"
#include "grammar.hpp"
#include "ntup/errors.hpp"
#include <tao/pegtl.hpp>
#include <stdexcept>

namespace ntup::reader::actions {
using namespace tao::pegtl;
using ntup::reader::build_state;

namespace detail {

template<typename Input>
node_ptr located(node_data d, const Input& in){
    auto n = ntup::detail::make_node(std::move(d));
    auto p = in.position();
    ntup::detail::attach_pos(*n, (int)p.line, (int)p.column, (int)p.line, (int)(p.column + in.size()));
    return n;
}

inline std::string unescape(const std::string& raw){
    std::string out; out.reserve(raw.size());
    for(size_t i=0;i<raw.size();++i){
        char c = raw[i];
        if(c != '\\' || i+1 == raw.size()){ out += c; continue; }
        char e = raw[++i];
        switch(e){
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            default: out += e; break;
        }
    }
    return out;
}

template<typename Input>
void close_into(build_state& st, build_state::kind expected, const Input& in){
    auto p = in.position();
    build_state::frame f = st.close();
    if(f.k != expected) throw ntup::parse_error("mismatched collection delimiter", (int)p.line, (int)p.column);
    node_ptr n;
    switch(f.k){
        case build_state::kind::list: { list l; l.elems = std::move(f.elems); n = ntup::detail::make_node(std::move(l)); break; }
        case build_state::kind::vector: { vector_t v; v.elems = std::move(f.elems); n = ntup::detail::make_node(std::move(v)); break; }
        case build_state::kind::map: {
            if(f.elems.size() % 2) throw ntup::parse_error("map literal requires an even number of forms", f.line, f.col);
            map m;
            for(size_t i=0;i<f.elems.size();i+=2) m.entries.emplace_back(f.elems[i], f.elems[i+1]);
            n = ntup::detail::make_node(std::move(m));
            break;
        }
        case build_state::kind::tagged: {
            if(f.elems.size() != 1) throw ntup::parse_error("tagged literal #" + f.tag + " requires exactly one form", f.line, f.col);
            n = ntup::detail::make_node(tagged_value{ symbol{f.tag}, f.elems.front() });
            break;
        }
        case build_state::kind::root: throw std::logic_error("reader closed the root frame");
    }
    ntup::detail::attach_pos(*n, f.line, f.col, (int)p.line, (int)(p.column + in.size()));
    st.push(std::move(n));
}

} // namespace detail

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::string_body > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto n = ntup::detail::make_node(node_data{ detail::unescape(in.string()) });
        auto p = in.position();
        // span includes both quotes
        ntup::detail::attach_pos(*n, (int)p.line, (int)p.column - 1, (int)p.line, (int)(p.column + in.size() + 1));
        st.push(std::move(n));
    }
};

template<> struct action< grammar::number > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        const std::string text = in.string();
        const bool is_float = text.find_first_of(".eE") != std::string::npos;
        auto p = in.position();
        try {
            if(is_float) st.push(detail::located(node_data{ std::stod(text) }, in));
            else st.push(detail::located(node_data{ static_cast<int64_t>(std::stoll(text)) }, in));
        } catch(const std::out_of_range&){
            throw ntup::parse_error("number out of range: " + text, (int)p.line, (int)p.column);
        }
    }
};

template<> struct action< grammar::keyword_tok > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.push(detail::located(node_data{ keyword{ in.string().substr(1) } }, in));
    }
};

template<> struct action< grammar::symbol_tok > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        const std::string s = in.string();
        if(s == "nil") st.push(detail::located(node_data{ std::monostate{} }, in));
        else if(s == "true") st.push(detail::located(node_data{ true }, in));
        else if(s == "false") st.push(detail::located(node_data{ false }, in));
        else st.push(detail::located(node_data{ symbol{s} }, in));
    }
};

template<build_state::kind K>
struct open_action {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        auto p = in.position();
        st.open(K, (int)p.line, (int)p.column);
    }
};

template<build_state::kind K>
struct close_action {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ detail::close_into(st, K, in); }
};

template<> struct action< grammar::list_open > : open_action< build_state::kind::list > {};
template<> struct action< grammar::list_close > : close_action< build_state::kind::list > {};
template<> struct action< grammar::vector_open > : open_action< build_state::kind::vector > {};
template<> struct action< grammar::vector_close > : close_action< build_state::kind::vector > {};
template<> struct action< grammar::map_open > : open_action< build_state::kind::map > {};
template<> struct action< grammar::map_close > : close_action< build_state::kind::map > {};
template<> struct action< grammar::tag_open > : open_action< build_state::kind::tagged > {};

template<> struct action< grammar::tag_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.frames.back().tag = in.string(); }
};

// The tagged frame closes once its single value has been read
template<> struct action< grammar::tagged_form > : close_action< build_state::kind::tagged > {};

} // namespace ntup::reader::actions
