#include <gtest/gtest.h>
#include "ntup/errors.hpp"
#include "test_support.hpp"

using namespace ntup;

class UpdateGet : public ::testing::Test {
protected:
    Expander ex{ExpandOptions{}};
    void SetUp() override {
        ex.define_public("user", "point", parse("{:x 0 :y 0 :z 0}"));
    }
    std::string expand(const char* src, bool in_match = false){ return test::expand_str(ex, src, in_match); }
};

TEST_F(UpdateGet, GetEmitsIndexedRead){
    EXPECT_EQ(expand("(point p :y)"), "(tuple/elem p 1)");
    EXPECT_EQ(expand("(point (point) :z)"), "(tuple/elem [0 0 0] 2)");
}

TEST_F(UpdateGet, UpdateComposesReplacementsInArgumentOrder){
    EXPECT_EQ(expand("(point p {:x 1 :z 3})"), "(tuple/put (tuple/put p 0 1) 2 3)");
    EXPECT_EQ(expand("(point p {:x 1 :x 2})"), "(tuple/put (tuple/put p 0 1) 0 2)");
}

TEST_F(UpdateGet, EmptyUpdateCopiesTheTupleExpression){
    auto call = parse("(point\n  p {})");
    const node_ptr& target = std::get<list>(call->data).elems[1];
    ASSERT_EQ(line(*target), 2);
    node_ptr out = ex.expand_expr(call);
    EXPECT_NE(out.get(), target.get());
    EXPECT_EQ(to_string(out), "p");
    EXPECT_EQ(line(*out), 1);
    EXPECT_EQ(line(*target), 2);
}

TEST_F(UpdateGet, UpdateHasNoWildcard){
    try {
        expand("(point p {:_ 0})");
        FAIL() << "expected unknown_field";
    } catch(const unknown_field& e){
        EXPECT_STREQ(e.what(), "tuple :point does not have the key: :_");
    }
}

TEST_F(UpdateGet, UnknownFieldNamesShapeAndField){
    try {
        expand("(point p :w)");
        FAIL() << "expected unknown_field";
    } catch(const unknown_field& e){
        EXPECT_EQ(e.shape, "point");
        EXPECT_EQ(e.field, "w");
    }
    try {
        expand("(point p {:x 1 :w 2})");
        FAIL() << "expected unknown_field";
    } catch(const unknown_field& e){
        EXPECT_EQ(e.shape, "point");
        EXPECT_EQ(e.field, "w");
        EXPECT_EQ(e.known, (std::vector<std::string>{ "x", "y", "z" }));
    }
}

TEST_F(UpdateGet, UpdateInPatternIsRejected){
    try {
        expand("(point p {:x 1})", true);
        FAIL() << "expected update_in_match_context";
    } catch(const update_in_match_context& e){
        EXPECT_EQ(e.code(), codes::UpdateInMatchContext);
        EXPECT_STREQ(e.what(), "cannot invoke update style macro inside match");
    }
    EXPECT_THROW(expand("(let [(point p {:y 2}) q] q)"), update_in_match_context);
    EXPECT_THROW(expand("(match? (point p {:y 2}) q)"), update_in_match_context);
}

TEST_F(UpdateGet, ValueSideOfLetIsNotAPattern){
    EXPECT_EQ(expand("(let [q (point p {:y 2})] q)"), "(let [q (tuple/put p 1 2)] q)");
}

TEST(UpdateProgram, LaterUpdatesWin){
    const char* shape = "(deftuple :timestamp [:date :time]) ";
    EXPECT_EQ(inspect(test::run_program(std::string(shape) + "(timestamp (timestamp (timestamp) {:date :foo}) {:date :bar :time :baz})")),
              "{:bar, :baz}");
    EXPECT_EQ(inspect(test::run_program(std::string(shape) + "(timestamp (timestamp) {:date :bar :date :qux})")), "{:qux, nil}");
    // construction keeps the first occurrence instead
    EXPECT_EQ(inspect(test::run_program(std::string(shape) + "(timestamp {:date :bar :date :qux})")), "{:bar, nil}");
}

TEST(UpdateProgram, OriginalContainerIsUntouched){
    Value v = test::run_program("(deftuple :point {:x 0 :y 0 :z 0}) (let [a (point) b (point a {:x 9})] [a b (point b :x)])");
    EXPECT_EQ(inspect(v), "{{0, 0, 0}, {9, 0, 0}, 9}");
}

TEST(UpdateProgram, UpdateInsidePatternFailsExpansion){
    auto res = test::expand_source("(deftuple :point {:x 0 :y 0 :z 0}) (let [(point p {:x 1}) (point)] p)");
    ASSERT_FALSE(res.success);
    ASSERT_EQ(res.errors.size(), 1u);
    EXPECT_EQ(res.errors[0].code, codes::UpdateInMatchContext);
}
