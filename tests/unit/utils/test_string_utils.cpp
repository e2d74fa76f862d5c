//
// Created by gregorian on 19/10/2026.
//

#include <gtest/gtest.h>
#include "insight/utils/string_utils.h"

using namespace insight::utils;

TEST(StringUtilsTest, Join) {
    EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(join({}, ","), "");
    EXPECT_EQ(join({"only"}, ","), "only");
}

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trim("  hello \t\n"), "hello");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("x"), "x");
}

TEST(StringUtilsTest, CaseConversion) {
    EXPECT_EQ(to_lower("SQL-Injection"), "sql-injection");
    EXPECT_EQ(to_upper("warn"), "WARN");
}

TEST(StringUtilsTest, ReplaceAll) {
    EXPECT_EQ(replace_all("src\\ui\\App.tsx", "\\", "/"), "src/ui/App.tsx");
    EXPECT_EQ(replace_all("aaa", "a", "aa"), "aaaaaa");
    EXPECT_EQ(replace_all("abc", "", "x"), "abc");
}

TEST(StringUtilsTest, FormatFixed) {
    EXPECT_EQ(format_fixed(75.0, 1), "75.0");
    EXPECT_EQ(format_fixed(0.8333, 2), "0.83");
}

TEST(GlobMatchTest, DoubleStarMatchesAnyDepth) {
    EXPECT_TRUE(glob_match("**/components/**", "src/components/Button.tsx"));
    EXPECT_TRUE(glob_match("**/components/**", "components/Button.tsx"));
    EXPECT_TRUE(glob_match("**/components/**", "a/b/c/components/deep/Card.tsx"));
    EXPECT_FALSE(glob_match("**/components/**", "src/component/Button.tsx"));
}

TEST(GlobMatchTest, SingleStarStopsAtSeparator) {
    EXPECT_TRUE(glob_match("src/*.ts", "src/index.ts"));
    EXPECT_FALSE(glob_match("src/*.ts", "src/lib/index.ts"));
    EXPECT_TRUE(glob_match("*", "file"));
    EXPECT_FALSE(glob_match("*", "dir/file"));
}

TEST(GlobMatchTest, QuestionMark) {
    EXPECT_TRUE(glob_match("v?.ts", "v1.ts"));
    EXPECT_FALSE(glob_match("v?.ts", "v10.ts"));
    EXPECT_FALSE(glob_match("a?b", "a/b"));
}

TEST(GlobMatchTest, LiteralPattern) {
    EXPECT_TRUE(glob_match("src/main.ts", "src/main.ts"));
    EXPECT_FALSE(glob_match("src/main.ts", "src/main.tsx"));
}
