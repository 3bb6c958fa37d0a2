#include <gtest/gtest.h>
#include "test_support.hpp"
#include <fstream>
#include <sstream>

using namespace ntup;

#ifndef NTUP_SOURCE_DIR
#define NTUP_SOURCE_DIR "."
#endif

static std::string read_file(const std::string& path){ std::ifstream ifs(path); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

TEST(ExamplesSmoke, SpaceProgramRuns){
    std::string src = read_file(std::string(NTUP_SOURCE_DIR) + "/examples/space.ntup");
    ASSERT_FALSE(src.empty());
    Expander ex{ExpandOptions{}};
    auto res = ex.expand_program(parse_all(src, "space.ntup"));
    ASSERT_TRUE(res.success) << (res.errors.empty() ? std::string() : res.errors[0].message);
    Interpreter in;
    Value last = in.run(res.forms);

    EXPECT_EQ(inspect(*in.global("Space", "origin")), "{0, 0, 0}");
    EXPECT_EQ(inspect(*in.global("Space", "p")), "{1, 2, 0}");
    EXPECT_EQ(inspect(*in.global("Space", "moved")), "{10, 2, 30}");
    EXPECT_EQ(inspect(*in.global("Space", "stamp")), "{\"2024-01-01\", nil}");
    EXPECT_EQ(inspect(*in.global("Space", "counters")), "{0}");
    EXPECT_EQ(inspect(last),
              "{[x: 4, y: 5, z: 6], \"expected argument to be a :point tuple of size 3, got: {1, 2}\", {true, false}}");
}
