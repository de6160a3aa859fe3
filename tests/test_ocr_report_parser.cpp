#include <gtest/gtest.h>

#include "report/OcrReportParser.hpp"

#include <string>

using namespace report;

static const char* kScannedCard =
    "Student Betalls\n"
    "Name Arif Bin Hassan Languages 74/100\n"
    "Gender: Male Nationality: Malaysian\n"
    "State Negeri Sembilan\n"
    "Mathematics 88/100 | Punctuality Good\n"
    "Science 67/100\n"
    "Chess Club Member\n";

static const CanonicalRecord* find_label(const CanonicalTable& t, const std::string& label) {
    for (const auto& r : t) {
        if (r.label == label) return &r;
    }
    return nullptr;
}

TEST(OcrReportParserTest, SplitsMetadataFromScores) {
    const CanonicalTable t = parse_ocr_report(kScannedCard);
    ASSERT_EQ(t.size(), 9u);

    EXPECT_EQ(t[0].section, "Student Details");
    EXPECT_EQ(t[0].label, "Student Name");
    EXPECT_EQ(t[0].value.value_or(""), "Arif Bin Hassan");

    const CanonicalRecord* lang = find_label(t, "Languages");
    ASSERT_NE(lang, nullptr);
    EXPECT_EQ(lang->section, "Subjects");
    EXPECT_DOUBLE_EQ(lang->score.value_or(-1), 74.0);
    EXPECT_DOUBLE_EQ(lang->maximum.value_or(-1), 100.0);

    const CanonicalRecord* state = find_label(t, "State");
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->value.value_or(""), "Negeri Sembilan");

    const CanonicalRecord* nat = find_label(t, "Nationality");
    ASSERT_NE(nat, nullptr);
    EXPECT_EQ(nat->value.value_or(""), "Malaysian");
}

TEST(OcrReportParserTest, ParallelColumnsSplitOnBar) {
    const CanonicalTable t = parse_ocr_report(kScannedCard);

    const CanonicalRecord* maths = find_label(t, "Mathematics");
    ASSERT_NE(maths, nullptr);
    EXPECT_DOUBLE_EQ(maths->score.value_or(-1), 88.0);

    const CanonicalRecord* punct = find_label(t, "Punctuality");
    ASSERT_NE(punct, nullptr);
    EXPECT_EQ(punct->section, "Behaviour");
    EXPECT_EQ(punct->value.value_or(""), "Good");
}

TEST(OcrReportParserTest, ClubLinesAreCocurricular) {
    const CanonicalTable t = parse_ocr_report(kScannedCard);
    const CanonicalRecord* club = find_label(t, "Chess Club Member");
    ASSERT_NE(club, nullptr);
    EXPECT_EQ(club->section, "Co-curricular");
    EXPECT_TRUE(club->is_misc());
}

TEST(OcrReportParserTest, EmptyTextGivesEmptyTable) {
    EXPECT_TRUE(parse_ocr_report("").empty());
    EXPECT_TRUE(parse_ocr_report("\n\n   \n").empty());
}
