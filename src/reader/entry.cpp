#include "ntup/reader.hpp"
#include "ntup/errors.hpp"
#include "prelude.hpp"
#include "grammar.hpp"
#include "actions.hpp"
#include <tao/pegtl.hpp>

namespace ntup {
using namespace ntup::reader;

namespace {

template<typename Rule> inline constexpr const char* error_message = nullptr;
template<> inline constexpr const char* error_message< grammar::string_close > = "unterminated string";
template<> inline constexpr const char* error_message< grammar::list_close > = "expected ')' to close list";
template<> inline constexpr const char* error_message< grammar::vector_close > = "expected ']' to close tuple literal";
template<> inline constexpr const char* error_message< grammar::map_close > = "expected '}' to close association list";
template<> inline constexpr const char* error_message< grammar::tag_name > = "expected a tag name after '#'";
template<> inline constexpr const char* error_message< grammar::value > = "expected a form after tag";
template<> inline constexpr const char* error_message< tao::pegtl::eof > = "unexpected character";

template<typename Rule>
struct control : tao::pegtl::normal<Rule> {
    template<typename Input, typename... States>
    [[noreturn]] static void raise(const Input& in, States&&... st){
        if constexpr(error_message<Rule> != nullptr) throw tao::pegtl::parse_error(error_message<Rule>, in);
        else tao::pegtl::normal<Rule>::raise(in, st...);
    }
};

} // namespace

std::vector<node_ptr> parse_all(std::string_view src, std::string_view filename){
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(filename));
    build_state st;
    try {
        tao::pegtl::parse< grammar::file, actions::action, control >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        throw ntup::parse_error(e.what(), static_cast<int>(p.line), static_cast<int>(p.column));
    }
    return std::move(st.forms());
}

node_ptr parse(std::string_view src, std::string_view filename){
    auto forms = parse_all(src, filename);
    if(forms.empty()) throw ntup::parse_error("expected a form", 1, 1);
    if(forms.size() > 1) throw ntup::parse_error("unexpected trailing forms", line(*forms[1]), col(*forms[1]));
    return forms.front();
}

} // namespace ntup
