#include <gtest/gtest.h>
#include "stencil/compiler/arguments.hpp"

using namespace stencil;
using namespace stencil::compiler;

// ============================================================================
// Argument lists
// ============================================================================

TEST(ArgListTest, PrunesTrailingAbsentArguments) {
    EXPECT_EQ(arg_list({"'a'"_s, std::nullopt, "'b'"_s, std::nullopt}), "'a', null, 'b'"_s);
}

TEST(ArgListTest, KeepsTailWhenNotPruning) {
    EXPECT_EQ(arg_list({"'a'"_s, std::nullopt, "'b'"_s, std::nullopt}, false),
              "'a', null, 'b', null"_s);
}

TEST(ArgListTest, InteriorAbsentBecomesNull) {
    EXPECT_EQ(arg_list({std::nullopt, "$x"_s}), "null, $x"_s);
}

TEST(ArgListTest, AllAbsent) {
    EXPECT_EQ(arg_list({std::nullopt, std::nullopt}), ""_s);
    EXPECT_EQ(arg_list({std::nullopt, std::nullopt}, false), "null, null"_s);
}

TEST(ArgListTest, Empty) {
    EXPECT_EQ(arg_list({}), ""_s);
}

TEST(ArgListTest, ArgumentsAreNotQuoted) {
    EXPECT_EQ(arg_list({"plain"_s}), "plain"_s);
}

// ============================================================================
// AttributeMap
// ============================================================================

TEST(AttributeMapTest, KeepsInsertionOrder) {
    AttributeMap map;
    map.set("z"_s, "1"_s);
    map.set("a"_s, "2"_s);

    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map.entries()[0].first, "z"_s);
    EXPECT_EQ(map.entries()[1].first, "a"_s);
}

TEST(AttributeMapTest, SetReplacesExistingValue) {
    AttributeMap map{{"x"_s, "1"_s}, {"y"_s, "2"_s}};
    map.set("x"_s, "3"_s);

    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map.get("x"_s), "3"_s);
    EXPECT_EQ(map.entries()[0].first, "x"_s);
}

TEST(AttributeMapTest, Lookup) {
    AttributeMap map{{"x"_s, ""_s}};

    EXPECT_TRUE(map.contains("x"_s));
    EXPECT_EQ(map.get("x"_s), ""_s);
    EXPECT_FALSE(map.contains("y"_s));
    EXPECT_EQ(map.get("y"_s), std::nullopt);
    EXPECT_FALSE(map.empty());
    EXPECT_TRUE(AttributeMap().empty());
}

TEST(AttributeStringTest, RendersPairsWithLeadingSpace) {
    AttributeMap map{{"x"_s, "1"_s}, {"y"_s, "d"_s}};
    EXPECT_EQ(attribute_string(map), " x=\"1\" y=\"d\""_s);
}

TEST(AttributeStringTest, EmptyMapRendersNothing) {
    EXPECT_EQ(attribute_string(AttributeMap()), ""_s);
}

TEST(AttributeSpecTest, EntriesFromNamesAndDefaults) {
    AttributeSpec spec{"x", {"y", "d"}};

    ASSERT_EQ(spec.size(), 2u);
    EXPECT_EQ(spec[0].name, "x"_s);
    EXPECT_EQ(spec[0].default_value, std::nullopt);
    EXPECT_EQ(spec[1].name, "y"_s);
    EXPECT_EQ(spec[1].default_value, "d"_s);
}
