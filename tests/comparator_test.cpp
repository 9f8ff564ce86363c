#include <gtest/gtest.h>
#include <bits/stdc++.h>
#include "src/worker/comparator.h"
using namespace std;

TEST(ComparatorTest, WhitespaceRunsIgnoredByDefault) {
    ComparisonResult result = compare_outputs("3 5\n", "3  5");
    EXPECT_TRUE(result.match);
    EXPECT_TRUE(result.differences.empty());
}

TEST(ComparatorTest, IdenticalOutputMatches) {
    ComparisonResult result = compare_outputs("1\n2\n3\n", "1\n2\n3\n", false);
    EXPECT_TRUE(result.match);
    EXPECT_EQ(result.actual_line_count, 3);
    EXPECT_EQ(result.expected_line_count, 3);
}

TEST(ComparatorTest, LineDifferenceWhenWhitespaceSignificant) {
    ComparisonResult result = compare_outputs("A\nB\n", "A\nC\n", false);
    EXPECT_FALSE(result.match);
    ASSERT_EQ(result.differences.size(), 1u);
    EXPECT_EQ(result.differences[0].line, 2);
    EXPECT_EQ(result.differences[0].actual, "B");
    EXPECT_EQ(result.differences[0].expected, "C");
}

// Collapsing runs newlines too, so the whole output becomes a single line
TEST(ComparatorTest, CollapsedOutputReportsLineOne) {
    ComparisonResult result = compare_outputs("A\nB\n", "A\nC\n");
    EXPECT_FALSE(result.match);
    ASSERT_EQ(result.differences.size(), 1u);
    EXPECT_EQ(result.differences[0].line, 1);
    EXPECT_EQ(result.differences[0].actual, "A B");
    EXPECT_EQ(result.differences[0].expected, "A C");
    EXPECT_EQ(result.actual_line_count, 1);
    EXPECT_EQ(result.expected_line_count, 1);
}

TEST(ComparatorTest, IgnoreCase) {
    EXPECT_FALSE(compare_outputs("YES\n", "yes\n").match);
    EXPECT_TRUE(compare_outputs("YES\n", "yes\n", true, true).match);
    EXPECT_TRUE(compare_outputs("Yes\nNo\n", "yes\nno\n", false, true).match);
}

TEST(ComparatorTest, MissingLinesPaddedWithEmpty) {
    ComparisonResult result = compare_outputs("1\n2\n", "1\n2\n3\n4\n", false);
    EXPECT_FALSE(result.match);
    EXPECT_EQ(result.actual_line_count, 2);
    EXPECT_EQ(result.expected_line_count, 4);
    ASSERT_EQ(result.differences.size(), 2u);
    EXPECT_EQ(result.differences[0].line, 3);
    EXPECT_EQ(result.differences[0].actual, "");
    EXPECT_EQ(result.differences[0].expected, "3");
    EXPECT_EQ(result.differences[1].line, 4);
    EXPECT_EQ(result.differences[1].expected, "4");
}

TEST(ComparatorTest, TrailingBlankLinesStripped) {
    EXPECT_TRUE(compare_outputs("42\n\n\n", "42", false).match);
    EXPECT_TRUE(compare_outputs("  42", "42\n", false).match);
}

TEST(ComparatorTest, InnerSpacesSignificantWithoutIgnoreWhitespace) {
    ComparisonResult result = compare_outputs("3 5", "3  5", false);
    EXPECT_FALSE(result.match);
    ASSERT_EQ(result.differences.size(), 1u);
    EXPECT_EQ(result.differences[0].line, 1);
}

TEST(ComparatorTest, EmptyInputs) {
    ComparisonResult result = compare_outputs("", "");
    EXPECT_TRUE(result.match);
    EXPECT_EQ(result.actual_line_count, 1);
    EXPECT_EQ(result.expected_line_count, 1);

    result = compare_outputs("", "1\n", false);
    EXPECT_FALSE(result.match);
    ASSERT_EQ(result.differences.size(), 1u);
    EXPECT_EQ(result.differences[0].actual, "");
    EXPECT_EQ(result.differences[0].expected, "1");
}

TEST(ComparatorTest, Helpers) {
    EXPECT_EQ(collapse_whitespace("  a\t\tb \n c  "), "a b c");
    EXPECT_EQ(strip_whitespace("\n\t x y \r\n"), "x y");
    EXPECT_EQ(split_lines(""), vector<string>({""}));
    EXPECT_EQ(split_lines("a\n"), vector<string>({"a", ""}));
    EXPECT_EQ(split_lines("a\nb"), vector<string>({"a", "b"}));
}
