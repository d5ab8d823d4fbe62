/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <fiscid/utils/string_utils.h>

using namespace fiscid::utils;

class StringUtilsTest : public ::testing::Test {};

// toLower / toUpper
TEST_F(StringUtilsTest, ToLower_Email) {
    EXPECT_EQ(toLower("Mario.Rossi@Example.IT"), "mario.rossi@example.it");
}

TEST_F(StringUtilsTest, ToLower_Empty) {
    EXPECT_EQ(toLower(""), "");
}

TEST_F(StringUtilsTest, ToUpper_TaxCode) {
    EXPECT_EQ(toUpper("rssmra80a01h501u"), "RSSMRA80A01H501U");
}

TEST_F(StringUtilsTest, ToUpper_LeavesNonLettersAlone) {
    EXPECT_EQ(toUpper("it-123 45"), "IT-123 45");
}

// trim
TEST_F(StringUtilsTest, Trim_BothEnds) {
    EXPECT_EQ(trim("  Rossi  "), "Rossi");
}

TEST_F(StringUtilsTest, Trim_TabsAndNewlines) {
    EXPECT_EQ(trim("\t\nMario\r\n"), "Mario");
}

TEST_F(StringUtilsTest, Trim_InnerSpacesKept) {
    EXPECT_EQ(trim(" De Luca "), "De Luca");
}

TEST_F(StringUtilsTest, Trim_OnlySpaces) {
    EXPECT_EQ(trim("    "), "");
}

TEST_F(StringUtilsTest, Trim_Empty) {
    EXPECT_EQ(trim(""), "");
}

// isBlank
TEST_F(StringUtilsTest, IsBlank) {
    EXPECT_TRUE(isBlank(""));
    EXPECT_TRUE(isBlank(" \t\n"));
    EXPECT_FALSE(isBlank(" x "));
}

// removeChars
TEST_F(StringUtilsTest, RemoveChars_PhoneSeparators) {
    EXPECT_EQ(removeChars("+39 (06) 123-45.67", " -.()"), "+39061234567");
}

TEST_F(StringUtilsTest, RemoveChars_NothingToRemove) {
    EXPECT_EQ(removeChars("0612345", " -"), "0612345");
    EXPECT_EQ(removeChars("", " -"), "");
}
