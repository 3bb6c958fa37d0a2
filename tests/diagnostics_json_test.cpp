#include <gtest/gtest.h>
#include "ntup/diagnostics_json.hpp"
#include "ntup/errors.hpp"
#include "test_support.hpp"

using namespace ntup;

static std::string to_json(const char* src){ return diagnostics_to_json(test::expand_source(src)); }

TEST(DiagnosticsJson, SuccessHasEmptyErrors){
    EXPECT_EQ(to_json("(module :name M (deftuple :p [:x]) (p))"), "{\"success\":true,\"errors\":[]}");
}

TEST(DiagnosticsJson, UnknownFieldCarriesHintAndNotes){
    auto js = to_json("(module :name M (deftuple :p [:time :date]) (p {:tme 1}))");
    EXPECT_NE(js.find("\"success\":false"), std::string::npos);
    EXPECT_NE(js.find("\"code\":\"E2003\""), std::string::npos);
    EXPECT_NE(js.find("\"hint\":\"known fields: :time, :date\""), std::string::npos);
    auto notes = js.find("\"notes\":[");
    ASSERT_NE(notes, std::string::npos);
    EXPECT_NE(js.find("did you mean :time?", notes), std::string::npos);
    EXPECT_EQ(js.find("did you mean :date?"), std::string::npos);
}

TEST(DiagnosticsJson, OneEntryPerFailedForm){
    auto res = test::expand_source(
        "(module :name M\n"
        "  (deftuple :p [\"x\"])\n"
        "  (deftuple :q [:a])\n"
        "  (q r 5)\n"
        "  (q r {:a 1}))");
    ASSERT_EQ(res.errors.size(), 2u);
    EXPECT_EQ(res.errors[0].code, codes::NonAtomFieldName);
    EXPECT_EQ(res.errors[0].line, 2);
    EXPECT_EQ(res.errors[1].code, codes::InvalidArgumentShape);
    EXPECT_EQ(res.errors[1].line, 4);
    auto js = diagnostics_to_json(res);
    EXPECT_NE(js.find("\"message\":\"deftuple fields must be atoms, got: \\\"x\\\"\""), std::string::npos);
}

TEST(DiagnosticsJson, Escaping){
    EXPECT_EQ(json_escape("a\"b\n"), "\"a\\\"b\\n\"");
    EXPECT_EQ(json_escape("back\\slash\ttab"), "\"back\\\\slash\\ttab\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(Suggestions, EditDistance){
    EXPECT_EQ(edit_distance("kitten", "sitting"), 3);
    EXPECT_EQ(edit_distance("", "abc"), 3);
    EXPECT_EQ(edit_distance("same", "same"), 0);
    EXPECT_EQ(fuzzy_candidates("tme", { "time", "date", "x" }), (std::vector<std::string>{ "time" }));
    EXPECT_TRUE(fuzzy_candidates("x", { "x" }).empty());
}
