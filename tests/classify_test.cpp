#include <gtest/gtest.h>
#include "ntup/classify.hpp"
#include "ntup/errors.hpp"
#include "test_support.hpp"

using namespace ntup;

static CallSite classify_src(const char* src){
    auto n = parse(src);
    return classify(std::get<list>(n->data));
}

TEST(DispatchClassifier, ZeroAndOneArgumentShapes){
    EXPECT_TRUE(std::holds_alternative<callsite::Empty>(classify_src("(point)")));

    auto field = classify_src("(point :x)");
    ASSERT_TRUE(std::holds_alternative<callsite::SingleFieldName>(field));
    EXPECT_EQ(std::get<callsite::SingleFieldName>(field).field, "x");

    auto alist = classify_src("(point {:x 1 :y 2})");
    ASSERT_TRUE(std::holds_alternative<callsite::SingleAssocList>(alist));
    EXPECT_EQ(std::get<callsite::SingleAssocList>(alist).entries.size(), 2u);

    EXPECT_TRUE(std::holds_alternative<callsite::SingleAssocList>(classify_src("(point {})")));
    EXPECT_TRUE(std::holds_alternative<callsite::SingleOpaque>(classify_src("(point {\"x\" 1})")));
    EXPECT_TRUE(std::holds_alternative<callsite::SingleOpaque>(classify_src("(point (f))")));
    EXPECT_TRUE(std::holds_alternative<callsite::SingleOpaque>(classify_src("(point [1 2 3])")));
    EXPECT_TRUE(std::holds_alternative<callsite::SingleOpaque>(classify_src("(point q)")));
}

TEST(DispatchClassifier, TwoArgumentShapes){
    auto get = classify_src("(point p :y)");
    ASSERT_TRUE(std::holds_alternative<callsite::GetField>(get));
    EXPECT_EQ(std::get<callsite::GetField>(get).field, "y");
    EXPECT_EQ(to_string(std::get<callsite::GetField>(get).container), "p");

    auto upd = classify_src("(point (make) {:x 1})");
    ASSERT_TRUE(std::holds_alternative<callsite::UpdateFields>(upd));
    EXPECT_EQ(to_string(std::get<callsite::UpdateFields>(upd).container), "(make)");
    EXPECT_STREQ(callsite_name(upd), "update");
}

TEST(DispatchClassifier, SecondArgumentMustBeStatic){
    try {
        classify_src("(point p 42)");
        FAIL() << "expected invalid_argument_shape";
    } catch(const invalid_argument_shape& e){
        EXPECT_EQ(e.code(), codes::InvalidArgumentShape);
        EXPECT_STREQ(e.what(), "expected arguments to be a compile time atom or keywords, got: 42");
    }
    EXPECT_THROW(classify_src("(point p (fields))"), invalid_argument_shape);
    EXPECT_THROW(classify_src("(point p {\"x\" 1})"), invalid_argument_shape);
    EXPECT_THROW(classify_src("(point a b c)"), invalid_argument_shape);
}

class OpaqueNarrowing : public ::testing::Test {
protected:
    Expander ex{ExpandOptions{}};
    void SetUp() override {
        ex.define_public("user", "point", parse("{:x 0 :y 0 :z 0}"));
        ex.define_public("user", "pair", parse("[:l :r]"));
    }
};

TEST_F(OpaqueNarrowing, TupleLiteralOfMatchingArityConvertsStatically){
    EXPECT_EQ(test::expand_str(ex, "(point [1 2 3])"), "{:x 1 :y 2 :z 3}");
    EXPECT_EQ(test::expand_str(ex, "(pair [a b])"), "{:l a :r b}");
}

TEST_F(OpaqueNarrowing, ArgumentIsExpandedBeforeNarrowing){
    EXPECT_EQ(test::expand_str(ex, "(point (point))"), "{:x 0 :y 0 :z 0}");
    EXPECT_EQ(test::expand_str(ex, "(pair (pair {:r 5}))"), "{:l nil :r 5}");
}

TEST_F(OpaqueNarrowing, AnythingElseDefersToRunTime){
    EXPECT_EQ(test::expand_str(ex, "(point [1 2])"), "(tuple/to-alist :point [:x :y :z] [1 2])");
    EXPECT_EQ(test::expand_str(ex, "(point q)"), "(tuple/to-alist :point [:x :y :z] q)");
    EXPECT_EQ(test::expand_str(ex, "(pair (load))"), "(tuple/to-alist :pair [:l :r] (load))");
}
