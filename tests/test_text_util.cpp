#include <gtest/gtest.h>

#include "text/TextUtil.hpp"

TEST(TextUtilTest, TitleCaseRestartsAfterNonLetters) {
    EXPECT_EQ(textutil::title_case("sejarah (history)"), "Sejarah (History)");
    EXPECT_EQ(textutil::title_case("SELF-CONTROL"), "Self-Control");
}

TEST(TextUtilTest, CollapseSpacesKeepsNewlines) {
    EXPECT_EQ(textutil::collapse_spaces("  a \t  b  "), "a b");
    EXPECT_EQ(textutil::collapse_spaces("a\nb"), "a\nb");
}

TEST(TextUtilTest, SplitLinesDropsCarriageReturns) {
    const auto lines = textutil::split_lines("one\r\ntwo\n\nthree");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "three");
}

TEST(TextUtilTest, ContainsPhraseIsWordBounded) {
    EXPECT_TRUE(textutil::contains_phrase("Art and Design", "art"));
    EXPECT_TRUE(textutil::contains_phrase("Paper 2: Additional Mathematics", "additional mathematics"));
    EXPECT_FALSE(textutil::contains_phrase("Participation", "art"));
    EXPECT_FALSE(textutil::contains_phrase("anything", ""));
}

TEST(TextUtilTest, ParseNumberRequiresWholeString) {
    double v = 0.0;
    EXPECT_TRUE(textutil::parse_number(" 12.5 ", v));
    EXPECT_DOUBLE_EQ(v, 12.5);
    EXPECT_TRUE(textutil::parse_number("74", v));
    EXPECT_DOUBLE_EQ(v, 74.0);
    EXPECT_FALSE(textutil::parse_number("74abc", v));
    EXPECT_FALSE(textutil::parse_number("", v));
    EXPECT_FALSE(textutil::parse_number("nan", v));
}
