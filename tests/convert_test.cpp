#include <gtest/gtest.h>
#include "ntup/convert.hpp"
#include "ntup/errors.hpp"
#include "test_support.hpp"

using namespace ntup;

static const std::vector<std::string> kPoint = { "x", "y", "z" };

TEST(Converter, ZipsFieldNamesInShapeOrder){
    Value out = to_alist("point", kPoint, v_tuple({ v_int(1), v_int(2), v_int(3) }));
    ASSERT_NE(out.as_alist(), nullptr);
    EXPECT_EQ(inspect(out), "[x: 1, y: 2, z: 3]");
    EXPECT_EQ(*out.as_alist()->find("y"), v_int(2));
}

TEST(Converter, ArityMismatchIsReported){
    try {
        to_alist("point", kPoint, v_tuple({ v_int(1), v_int(2) }));
        FAIL() << "expected shape_mismatch";
    } catch(const shape_mismatch& e){
        EXPECT_EQ(e.code(), codes::ShapeMismatch);
        EXPECT_EQ(e.shape, "point");
        EXPECT_EQ(e.expected_arity, 3u);
        EXPECT_EQ(e.actual, "{1, 2}");
        EXPECT_STREQ(e.what(), "expected argument to be a :point tuple of size 3, got: {1, 2}");
    }
    try {
        to_alist("point", kPoint, v_tuple({ v_int(1), v_int(2), v_int(3), v_int(4) }));
        FAIL() << "expected shape_mismatch";
    } catch(const shape_mismatch& e){
        EXPECT_EQ(e.actual, "{1, 2, 3, 4}");
        EXPECT_STREQ(e.what(), "expected argument to be a :point tuple of size 3, got: {1, 2, 3, 4}");
    }
}

TEST(Converter, NonTupleValuesAreReported){
    try {
        to_alist("point", kPoint, v_int(5));
        FAIL() << "expected shape_mismatch";
    } catch(const shape_mismatch& e){
        EXPECT_STREQ(e.what(), "expected argument to be a literal atom, literal keyword or a :point tuple, got runtime: 5");
    }
    // association lists are not accepted in place of a tuple
    EXPECT_THROW(to_alist("point", kPoint, v_alist({ { "x", v_int(1) } })), shape_mismatch);
}

TEST(Converter, DeferredConversionInPrograms){
    const char* shape = "(deftuple :point {:x 0 :y 0 :z 0}) ";
    EXPECT_EQ(inspect(test::run_program(std::string(shape) + "(let [t [1 2 3]] (point t))")), "[x: 1, y: 2, z: 3]");
    EXPECT_EQ(test::run_program(std::string(shape) + "(try (point [1 2]) (rescue e e))"),
              v_str("expected argument to be a :point tuple of size 3, got: {1, 2}"));
}

TEST(Converter, UnrescuedMismatchPropagates){
    EXPECT_THROW(test::run_program("(deftuple :pair [:l :r]) (pair \"ab\")"), shape_mismatch);
}

TEST(Converter, ResultSupportsFieldLookup){
    Value v = test::run_program("(deftuple :pair [:l :r]) (alist/get (pair [10 20]) :r)");
    EXPECT_EQ(v, v_int(20));
}
