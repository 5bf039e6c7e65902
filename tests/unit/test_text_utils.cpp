/**
 * @file test_text_utils.cpp
 * @brief Unit tests for the byte-level string helpers
 */

#include <gtest/gtest.h>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <regex>

using namespace NewsCube;

// ============================================================================
// Case and trimming
// ============================================================================

TEST(TextUtilsTest, ToLowerAsciiOnly) {
    EXPECT_EQ(to_lower("Pfizer INC."), "pfizer inc.");
    // UTF-8 bytes pass through untouched
    EXPECT_EQ(to_lower("Ümit"), "Ümit");
}

TEST(TextUtilsTest, TrimWhitespace) {
    EXPECT_EQ(trim("  \t Reuters \r\n"), "Reuters");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(TextUtilsTest, RtrimChars) {
    EXPECT_EQ(rtrim_chars("Pfizer.,", ".,"), "Pfizer");
    EXPECT_EQ(rtrim_chars("...", "."), "");
}

// ============================================================================
// Splitting and joining
// ============================================================================

TEST(TextUtilsTest, SplitAnyDropsEmptyPieces) {
    auto parts = split_any(" Pfizer; Eli Lilly ;; Oncology |", ";,|");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "Pfizer");
    EXPECT_EQ(parts[1], "Eli Lilly");
    EXPECT_EQ(parts[2], "Oncology");
}

TEST(TextUtilsTest, SplitWhitespace) {
    auto parts = split_whitespace("  fda   approves\tdrug\n");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "approves");
}

TEST(TextUtilsTest, Join) {
    EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(join({}, ","), "");
}

TEST(TextUtilsTest, Affixes) {
    EXPECT_TRUE(starts_with("series a funding", "series"));
    EXPECT_FALSE(starts_with("s", "series"));
    EXPECT_TRUE(ends_with("acquisition", "tion"));
    EXPECT_TRUE(contains("phase iii trial", "iii"));
}

// ============================================================================
// Character classes
// ============================================================================

TEST(TextUtilsTest, DigitsAndAlnum) {
    EXPECT_TRUE(is_all_digits("20240115"));
    EXPECT_FALSE(is_all_digits(""));
    EXPECT_FALSE(is_all_digits("12a"));

    EXPECT_TRUE(has_alnum("--a--"));
    EXPECT_FALSE(has_alnum("--- !!"));
    EXPECT_TRUE(has_alnum("日経"));
}

TEST(TextUtilsTest, RegexEscapeMatchesLiterally) {
    std::string escaped = regex_escape("stat+ (news)");
    std::regex re(escaped);
    EXPECT_TRUE(std::regex_match("stat+ (news)", re));
    EXPECT_FALSE(std::regex_match("statt news", re));
}

TEST(TextUtilsTest, TitleCase) {
    EXPECT_EQ(title_case("eli lilly"), "Eli Lilly");
    EXPECT_EQ(title_case("BIOGEN-IDEC"), "Biogen-Idec");
    EXPECT_EQ(title_case("3m"), "3M");
}

TEST(TextUtilsTest, TitleCaseKeepsPossessiveInWord) {
    EXPECT_EQ(title_case("astrazeneca's"), "Astrazeneca's");
    EXPECT_EQ(title_case("dr reddy's laboratories"), "Dr Reddy's Laboratories");
    EXPECT_EQ(title_case("'quoted' name"), "'Quoted' Name");
}

// ============================================================================
// Number formatting
// ============================================================================

TEST(TextUtilsTest, Round2) {
    EXPECT_DOUBLE_EQ(round2(0.666), 0.67);
    EXPECT_DOUBLE_EQ(round2(0.8), 0.8);
}

TEST(TextUtilsTest, FormatDecimal) {
    EXPECT_EQ(format_decimal(0.9), "0.9");
    EXPECT_EQ(format_decimal(1.0), "1.0");
    EXPECT_EQ(format_decimal(0.75), "0.75");
    EXPECT_EQ(format_decimal(0.4 + 0.1 * 2), "0.6");
}

TEST(TextUtilsTest, FormatElapsed) {
    EXPECT_EQ(format_elapsed(0.25), "250 ms");
    EXPECT_EQ(format_elapsed(12.4), "12.40 s");
    EXPECT_EQ(format_elapsed(187.0), "3m 07s");
}
