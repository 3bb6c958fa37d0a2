// Node-based form representation (host AST) with metadata & source positions
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <map>
#include <cstdint>
#include <functional>
#include <initializer_list>

namespace ntup
{

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct list;
    struct vector_t;
    struct map;
    struct tagged_value;
    struct node;

    using node_ptr = std::shared_ptr<node>;

    // (head args...) call or special form
    struct list
    {
        std::vector<node_ptr> elems;
    };
    // [a b c] positional tuple literal
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };
    // {:k v ...} association list literal; order and duplicate keys are preserved
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };
    struct tagged_value
    {
        symbol tag;
        node_ptr inner;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t, map, tagged_value>;

    struct node
    {
        node_data data;
        std::map<std::string, node_ptr> metadata;
    };

    // Structural deep equality of two forms. If ignore_metadata is true, metadata maps are ignored.
    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_metadata = true);

    // Deep copy; metadata maps are copied shallowly.
    node_ptr clone(const node_ptr &n);

    namespace detail
    {
        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
        inline node_ptr make_int(int64_t v) { return make_node(node_data{v}); }
        inline void attach_pos(node &n, int sl, int sc, int el, int ec)
        {
            n.metadata["line"] = make_int(sl);
            n.metadata["col"] = make_int(sc);
            n.metadata["end-line"] = make_int(el);
            n.metadata["end-col"] = make_int(ec);
        }
    }

    inline std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("<null>"); }
    // Pretty printer with newlines and indentation for readability
    inline std::string to_pretty_string(const node &n, int indentWidth = 2);
    inline std::string to_pretty_string(const node_ptr &p, int indentWidth = 2) { return to_pretty_string(*p, indentWidth); }

    inline std::string to_string(const node &n)
    {
        struct V
        {
            std::string operator()(std::monostate) const { return "nil"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const
            {
                std::ostringstream oss;
                oss << d;
                return oss.str();
            }
            std::string operator()(const std::string &s) const
            {
                std::string out = "\"";
                for (char c : s)
                {
                    if (c == '"' || c == '\\')
                        out += '\\';
                    if (c == '\n')
                    {
                        out += "\\n";
                        continue;
                    }
                    out += c;
                }
                return out + '"';
            }
            std::string operator()(const keyword &k) const { return ':' + k.name; }
            std::string operator()(const symbol &s) const { return s.name; }
            std::string join(const std::vector<node_ptr> &elems, char open, char close) const
            {
                std::string out(1, open);
                bool first = true;
                for (auto &ch : elems)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += to_string(ch);
                }
                out += close;
                return out;
            }
            std::string operator()(const list &l) const { return join(l.elems, '(', ')'); }
            std::string operator()(const vector_t &v) const { return join(v.elems, '[', ']'); }
            std::string operator()(const map &m) const
            {
                std::string out = "{";
                bool first = true;
                for (auto &kv : m.entries)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += to_string(kv.first) + ' ' + to_string(kv.second);
                }
                out += '}';
                return out;
            }
            std::string operator()(const tagged_value &tv) const { return '#' + tv.tag.name + ' ' + to_string(tv.inner); }
        };
        return std::visit(V{}, n.data);
    }

    inline bool is_atomic(const node &x)
    {
        return !std::holds_alternative<list>(x.data) && !std::holds_alternative<vector_t>(x.data) &&
               !std::holds_alternative<map>(x.data) && !std::holds_alternative<tagged_value>(x.data);
    }

    inline std::string to_pretty_string(const node &n, int indentWidth)
    {
        // Compact single-line output for short or all-atomic collections; modules and
        // let/do bodies always break so expanded programs stay readable.
        auto indentStr = [](int spaces) -> std::string {
            if (spaces < 0) spaces = 0;
            return std::string(static_cast<size_t>(spaces), ' ');
        };

        const size_t MAX_INLINE_LEN = 90;

        std::function<std::string(const node &, int)> pp = [&](const node &x, int indent) -> std::string {
            if (is_atomic(x) || std::holds_alternative<tagged_value>(x.data))
                return to_string(x);
            std::string flat = to_string(x);
            bool forceMulti = false;
            if (std::holds_alternative<list>(x.data))
            {
                const auto &elems = std::get<list>(x.data).elems;
                if (!elems.empty() && std::holds_alternative<symbol>(elems[0]->data))
                {
                    static const char *blockSyms[] = {"module", "do", "let", "try"};
                    const std::string &head = std::get<symbol>(elems[0]->data).name;
                    for (auto s : blockSyms)
                    {
                        if (head == s)
                        {
                            forceMulti = true;
                            break;
                        }
                    }
                }
            }
            if (!forceMulti && flat.size() <= MAX_INLINE_LEN)
                return flat;

            auto block = [&](const std::vector<node_ptr> &elems, const std::string &open, char close) {
                std::string out = open;
                size_t i = 0;
                for (auto &e : elems)
                {
                    out += (i == 0 && open == "(") ? "" : "\n" + indentStr(indent + indentWidth);
                    out += pp(*e, indent + indentWidth);
                    ++i;
                }
                out += '\n' + indentStr(indent) + close;
                return out;
            };
            if (std::holds_alternative<list>(x.data))
                return block(std::get<list>(x.data).elems, "(", ')');
            if (std::holds_alternative<vector_t>(x.data))
                return block(std::get<vector_t>(x.data).elems, "[", ']');
            const auto &entries = std::get<map>(x.data).entries;
            std::string out = "{";
            for (auto &kv : entries)
                out += '\n' + indentStr(indent + indentWidth) + pp(*kv.first, indent + indentWidth) + ' ' + pp(*kv.second, indent + indentWidth);
            out += '\n' + indentStr(indent) + '}';
            return out;
        };
        return pp(n, 0);
    }

    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline bool is_map(const node &n) { return std::holds_alternative<map>(n.data); }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }
    inline const keyword *as_keyword(const node &n) { return is_keyword(n) ? &std::get<keyword>(n.data) : nullptr; }

    // Head symbol name of a (head ...) list, empty if none.
    inline std::string head_name(const node &n)
    {
        auto *l = as_list(n);
        if (!l || l->elems.empty() || !l->elems[0])
            return {};
        auto *s = as_symbol(*l->elems[0]);
        return s ? s->name : std::string();
    }

    inline int meta_int(const node &n, const std::string &k, int def = -1)
    {
        auto it = n.metadata.find(k);
        if (it == n.metadata.end())
            return def;
        auto &nd = *it->second;
        if (std::holds_alternative<int64_t>(nd.data))
            return (int)std::get<int64_t>(nd.data);
        return def;
    }
    inline int line(const node &n) { return meta_int(n, "line"); }
    inline int col(const node &n) { return meta_int(n, "col"); }
    inline int end_line(const node &n) { return meta_int(n, "end-line"); }
    inline int end_col(const node &n) { return meta_int(n, "end-col"); }

    // ------ Factory helpers ------

    inline node_ptr n_nil() { return detail::make_node(std::monostate{}); }
    inline node_ptr n_sym(std::string name) { return detail::make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return detail::make_node(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr n_f64(double v) { return detail::make_node(v); }
    inline node_ptr n_bool(bool b) { return detail::make_node(b); }

    inline node_ptr node_list(std::initializer_list<node_ptr> xs)
    {
        list l;
        l.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(l));
    }
    inline node_ptr node_vec(std::vector<node_ptr> xs)
    {
        vector_t v;
        v.elems = std::move(xs);
        return detail::make_node(std::move(v));
    }
    inline node_ptr node_map(std::vector<std::pair<node_ptr, node_ptr>> xs)
    {
        map m;
        m.entries = std::move(xs);
        return detail::make_node(std::move(m));
    }

    // Copy source position of `from` onto `to` (used so emitted forms point back at the call site).
    inline node_ptr with_pos_of(node_ptr to, const node &from)
    {
        for (const char *k : {"line", "col", "end-line", "end-col"})
        {
            auto it = from.metadata.find(k);
            if (it != from.metadata.end())
                to->metadata[k] = it->second;
        }
        return to;
    }

} // namespace ntup
