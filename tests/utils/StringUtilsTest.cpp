#include <gtest/gtest.h>
#include "utils/StringUtils.hpp"

using namespace ledger::utils;

TEST(StringUtilsTest, Trim_AsciiWhitespace) {
    EXPECT_EQ(trim("  SMBC \t\n"), "SMBC");
    EXPECT_EQ(trim("SMBC"), "SMBC");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(StringUtilsTest, Trim_IdeographicSpace) {
    EXPECT_EQ(trim("\xE3\x80\x80現金\xE3\x80\x80"), "現金");
    EXPECT_EQ(trim(" \xE3\x80\x80 奨学金"), "奨学金");
    EXPECT_EQ(trim("\xE3\x80\x80"), "");
}

TEST(StringUtilsTest, Trim_KeepsInnerSpaces) {
    EXPECT_EQ(trim(" NURO 光 "), "NURO 光");
}

TEST(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(startsWith("2024-05-27", "2024-05"));
    EXPECT_TRUE(startsWith("2024-05-27", ""));
    EXPECT_FALSE(startsWith("2024-06-01", "2024-05"));
    EXPECT_FALSE(startsWith("2024", "2024-05"));
}
