#include <gtest/gtest.h>
#include "ntup/config.hpp"
#include "ntup/errors.hpp"
#include "test_support.hpp"

using namespace ntup;

TEST(Config, DefaultsWhenUnset){
    test::ScopedEnv a("NTUP_TRACE_EXPAND", nullptr), b("NTUP_DIAG_JSON", nullptr), c("NTUP_MAX_EXPAND_DEPTH", nullptr);
    ExpandOptions o = detect_options();
    EXPECT_FALSE(o.trace);
    EXPECT_FALSE(o.diag_json);
    EXPECT_EQ(o.max_depth, 256);
}

TEST(Config, ReadsFlagsAndDepth){
    test::ScopedEnv a("NTUP_TRACE_EXPAND", "1"), b("NTUP_DIAG_JSON", "yes"), c("NTUP_MAX_EXPAND_DEPTH", "7");
    ExpandOptions o = detect_options();
    EXPECT_TRUE(o.trace);
    EXPECT_TRUE(o.diag_json);
    EXPECT_EQ(o.max_depth, 7);
}

TEST(Config, MalformedDepthKeepsDefault){
    test::ScopedEnv c("NTUP_MAX_EXPAND_DEPTH", "deep");
    EXPECT_EQ(detect_options().max_depth, 256);
    test::ScopedEnv z("NTUP_MAX_EXPAND_DEPTH", "0");
    EXPECT_EQ(detect_options().max_depth, 256);
}

TEST(Config, ExpansionDepthIsBounded){
    const char* nested = "(point p {:x (point q {:x (point r {:x 1})})})";
    ExpandOptions shallow; shallow.max_depth = 2;
    Expander ex(shallow);
    ex.define_public("user", "point", parse("{:x 0 :y 0}"));
    try {
        ex.expand_expr(parse(nested));
        FAIL() << "expected expand_error";
    } catch(const expand_error& e){
        EXPECT_EQ(e.code(), codes::ExpansionTooDeep);
        EXPECT_STREQ(e.what(), "macro expansion exceeded depth 2 at point");
    }

    ExpandOptions enough; enough.max_depth = 3;
    Expander ok(enough);
    ok.define_public("user", "point", parse("{:x 0 :y 0}"));
    EXPECT_EQ(to_string(ok.expand_expr(parse(nested))),
              "(tuple/put p 0 (tuple/put q 0 (tuple/put r 0 1)))");
}
