/**
 * @file comparator_test.cpp
 * @brief 输出比较测试
 */

#include <gtest/gtest.h>

#include "core/comparator.h"

using namespace judgebox;

TEST(ComparatorTest, ExactIsByteForByte) {
    EXPECT_TRUE(compare_exact("1 2\n", "1 2\n").same);
    EXPECT_FALSE(compare_exact("1 2\n", "1 2").same);

    CompareResult r = compare_exact("abcX", "abcY");
    EXPECT_FALSE(r.same);
    EXPECT_NE(r.detail.find("byte 3"), std::string::npos);
}

TEST(ComparatorTest, TokensIgnoreWhitespaceLayout) {
    EXPECT_TRUE(compare_tokens("1   2\n3\n\n", "1 2 3").same);
    EXPECT_TRUE(compare_tokens("\t1\r\n2 ", "1\n2\n").same);
    EXPECT_TRUE(compare_tokens("", "  \n").same);
}

TEST(ComparatorTest, TokensReportFirstDifference) {
    CompareResult r = compare_tokens("1 2 4", "1 2 3");
    EXPECT_FALSE(r.same);
    EXPECT_NE(r.detail.find("token 3"), std::string::npos);
    EXPECT_NE(r.detail.find("'4'"), std::string::npos);

    CompareResult shorter = compare_tokens("1 2", "1 2 3");
    EXPECT_FALSE(shorter.same);
    EXPECT_NE(shorter.detail.find("read 2 tokens, expected 3"), std::string::npos);
}

TEST(ComparatorTest, TokensAreNotMerged) {
    EXPECT_FALSE(compare_tokens("12", "1 2").same);
}

TEST(ComparatorTest, LinesIgnoreTrailingBlanks) {
    EXPECT_TRUE(compare_lines("a b  \r\nc\n\n\n", "a b\nc").same);
    EXPECT_FALSE(compare_lines("a  b\n", "a b\n").same);
    EXPECT_FALSE(compare_lines("a\n\nb\n", "a\nb\n").same);

    CompareResult r = compare_lines("x\ny\n", "x\nz\n");
    EXPECT_FALSE(r.same);
    EXPECT_NE(r.detail.find("line 2"), std::string::npos);
}

TEST(ComparatorTest, LongTokensAreShortenedInDetail) {
    std::string a(100, 'a'), b(100, 'b');
    CompareResult r = compare_tokens(a, b);
    EXPECT_FALSE(r.same);
    EXPECT_LT(r.detail.size(), 120u);
}

TEST(ComparatorTest, ParseMode) {
    EXPECT_EQ(parse_compare_mode("exact"), CompareMode::Exact);
    EXPECT_EQ(parse_compare_mode("tokens"), CompareMode::Tokens);
    EXPECT_EQ(parse_compare_mode("line"), CompareMode::Lines);
    EXPECT_FALSE(parse_compare_mode("fuzzy").has_value());
    EXPECT_STREQ(compare_mode_str(CompareMode::Lines), "lines");
}

TEST(ComparatorTest, DispatchByMode) {
    EXPECT_TRUE(compare_output("1  2", "1 2", CompareMode::Tokens).same);
    EXPECT_FALSE(compare_output("1  2", "1 2", CompareMode::Exact).same);
    EXPECT_FALSE(compare_output("1  2", "1 2", CompareMode::Lines).same);
}
