#include <gtest/gtest.h>
#include "ntup/reader.hpp"
#include "ntup/errors.hpp"
#include <string>

using namespace ntup;

TEST(Reader, Atoms){
    EXPECT_EQ(std::get<int64_t>(parse("42")->data), 42);
    EXPECT_EQ(std::get<int64_t>(parse("-3")->data), -3);
    EXPECT_DOUBLE_EQ(std::get<double>(parse("1.5")->data), 1.5);
    EXPECT_DOUBLE_EQ(std::get<double>(parse("2e3")->data), 2000.0);
    EXPECT_EQ(std::get<std::string>(parse(R"("a\nb \"q\"")")->data), "a\nb \"q\"");
    EXPECT_EQ(std::get<keyword>(parse(":date")->data).name, "date");
    EXPECT_EQ(std::get<symbol>(parse("tuple/elem")->data).name, "tuple/elem");
    EXPECT_EQ(std::get<symbol>(parse("match?")->data).name, "match?");
    EXPECT_EQ(std::get<symbol>(parse("-")->data).name, "-");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(parse("nil")->data));
    EXPECT_EQ(std::get<bool>(parse("true")->data), true);
    EXPECT_EQ(std::get<bool>(parse("false")->data), false);
}

TEST(Reader, Collections){
    auto n = parse("(point p {:x 1, :y [2 3]})");
    EXPECT_EQ(to_string(n), "(point p {:x 1 :y [2 3]})");
    ASSERT_TRUE(is_list(*n));
    auto &m = std::get<map>(std::get<list>(n->data).elems[2]->data);
    ASSERT_EQ(m.entries.size(), 2u);
    EXPECT_EQ(to_string(m.entries[1].second), "[2 3]");
    EXPECT_EQ(to_string(parse("()")), "()");
}

TEST(Reader, MapsKeepOrderAndDuplicates){
    auto n = parse("{:x 1 :y 2 :x 3}");
    EXPECT_EQ(std::get<map>(n->data).entries.size(), 3u);
    EXPECT_EQ(to_string(n), "{:x 1 :y 2 :x 3}");
}

TEST(Reader, TaggedLiteral){
    auto n = parse(R"(#inst "2024-01-01")");
    ASSERT_TRUE(std::holds_alternative<tagged_value>(n->data));
    EXPECT_EQ(std::get<tagged_value>(n->data).tag.name, "inst");
    EXPECT_EQ(to_string(n), "#inst \"2024-01-01\"");
}

TEST(Reader, CommentsAndCommasSeparate){
    auto forms = parse_all("; header\n[1, 2] ; trailing\n;; done\n");
    ASSERT_EQ(forms.size(), 1u);
    EXPECT_EQ(to_string(forms[0]), "[1 2]");
    EXPECT_TRUE(parse_all("  ; nothing here\n").empty());
}

TEST(Reader, Positions){
    auto forms = parse_all("(a)\n  (b\n   c)");
    ASSERT_EQ(forms.size(), 2u);
    EXPECT_EQ(line(*forms[0]), 1);
    EXPECT_EQ(col(*forms[0]), 1);
    EXPECT_EQ(line(*forms[1]), 2);
    EXPECT_EQ(col(*forms[1]), 3);
    EXPECT_EQ(end_line(*forms[1]), 3);
    auto c = std::get<list>(forms[1]->data).elems[1];
    EXPECT_EQ(line(*c), 3);
    EXPECT_EQ(col(*c), 4);
}

static std::string parse_error_of(const char* src){
    try { parse_all(src); }
    catch(const parse_error& e){ return e.what(); }
    return {};
}

TEST(Reader, Errors){
    EXPECT_NE(parse_error_of("(a").find("expected ')'"), std::string::npos);
    EXPECT_NE(parse_error_of("[1 2)").find("expected ']'"), std::string::npos);
    EXPECT_NE(parse_error_of("\"open").find("unterminated string"), std::string::npos);
    EXPECT_NE(parse_error_of("{:a}").find("even number"), std::string::npos);
    EXPECT_NE(parse_error_of("# 1").find("tag name"), std::string::npos);
    EXPECT_FALSE(parse_error_of(")").empty());
    EXPECT_FALSE(parse_error_of("1abc").empty());
    EXPECT_THROW(parse(""), parse_error);
    EXPECT_THROW(parse("1 2"), parse_error);
}

TEST(Reader, ErrorPosition){
    try {
        parse_all("(ok)\n(bad ]");
        FAIL() << "expected parse_error";
    } catch(const parse_error& e){
        EXPECT_EQ(e.line, 2);
        EXPECT_EQ(e.col, 6);
    }
}
