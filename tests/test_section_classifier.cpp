#include <gtest/gtest.h>

#include "report/RecordBuilder.hpp"
#include "report/SectionClassifier.hpp"

#include <string>
#include <vector>

using namespace report;

class SectionClassifierTest : public ::testing::Test {
protected:
    const std::vector<std::string> report_lines = {
        "Student Details",
        "Name: Ahmad Daniel",
        "Gender: Male",
        "State: Selangor",
        "",
        "Subject Scores",
        "Mathematics 85 / 100",
        "Science 78/100",
        "English",
        "90 / 100",
        "Behaviour",
        "Punctuality Very Good",
        "Discipline Good",
        "Co-curricular",
        "Chess Club Member",
    };
};

TEST(SectionHeaderTest, RecognizesAliasesAndLetterSpacing) {
    EXPECT_EQ(detect_section_header("Subject Scores").value_or(""), "Subjects");
    EXPECT_EQ(detect_section_header("  BEHAVIOR ratings").value_or(""), "Behaviour");
    EXPECT_EQ(detect_section_header("Student Betalls").value_or(""), "Student Details");
    EXPECT_EQ(detect_section_header("S u b j e c t s").value_or(""), "Subjects");
    EXPECT_EQ(detect_section_header("Co curricular Activities").value_or(""), "Co-curricular");
    EXPECT_FALSE(detect_section_header("Mathematics 85").has_value());
}

TEST(SectionHeaderTest, AliasMustEndOnAWordBoundary) {
    EXPECT_EQ(detect_section_header("Behaviour: ratings").value_or(""), "Behaviour");
    EXPECT_FALSE(detect_section_header("Behavioural Science 70/100").has_value());
    EXPECT_FALSE(detect_section_header("Subjectsheet").has_value());

    SectionClassifier classifier;
    const CanonicalTable t = classifier.classify({"Subjects", "Behavioural Science 70/100"});
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t[0].section, "Subjects");
    EXPECT_EQ(t[0].label, "Behavioural Science");
    EXPECT_DOUBLE_EQ(t[0].score.value_or(-1), 70.0);
}

TEST(SectionHeaderTest, MetadataKeyNeedsWordBoundary) {
    EXPECT_EQ(detect_metadata_key("Form 4").value_or(""), "form");
    EXPECT_EQ(detect_metadata_key("Student Name: Ali").value_or(""), "student name");
    EXPECT_EQ(detect_metadata_key("Attendance: 95%").value_or(""), "attendance");
    EXPECT_FALSE(detect_metadata_key("Formal Dress Day").has_value());
    EXPECT_FALSE(detect_metadata_key("Mathematics 85").has_value());
}

TEST_F(SectionClassifierTest, TagsEveryLineOnce) {
    SectionClassifier classifier;
    const CanonicalTable t = classifier.classify(report_lines);

    ASSERT_EQ(t.size(), 9u);

    EXPECT_EQ(t[0].section, "Student Details");
    EXPECT_EQ(t[0].label, "Name: Ahmad Daniel");
    EXPECT_TRUE(t[0].is_misc());

    EXPECT_EQ(t[3].section, "Subjects");
    EXPECT_EQ(t[3].label, "Mathematics");
    EXPECT_DOUBLE_EQ(t[3].score.value_or(-1), 85.0);
    EXPECT_DOUBLE_EQ(t[3].maximum.value_or(-1), 100.0);

    // label and score on adjacent lines
    EXPECT_EQ(t[5].label, "English");
    EXPECT_DOUBLE_EQ(t[5].score.value_or(-1), 90.0);

    EXPECT_EQ(t[6].section, "Behaviour");
    EXPECT_EQ(t[6].label, "Punctuality");
    EXPECT_EQ(t[6].value.value_or(""), "Very Good");
    EXPECT_EQ(t[7].label, "Discipline");
    EXPECT_EQ(t[7].value.value_or(""), "Good");

    EXPECT_EQ(t[8].section, "Co-curricular");
    EXPECT_EQ(t[8].label, "Chess Club Member");

    ASSERT_TRUE(classifier.current_section().has_value());
    EXPECT_EQ(*classifier.current_section(), "Co-curricular");
}

TEST_F(SectionClassifierTest, LookaheadNeverJoinsAHeader) {
    SectionClassifier classifier;
    const CanonicalTable t = classifier.classify({"English", "Subjects 90"});

    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t[0].section, "Misc");
    EXPECT_EQ(t[0].label, "English");
}

TEST_F(SectionClassifierTest, LookaheadCanBeDisabled) {
    ClassifierConfig cfg;
    cfg.lookahead = false;
    SectionClassifier classifier(cfg);
    const CanonicalTable t = classifier.classify({"English", "90 / 100"});

    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[0].label, "English");
    EXPECT_FALSE(t[0].score.has_value());
}

TEST_F(SectionClassifierTest, DamagedRatingsAreNotScores) {
    SectionClassifier classifier;
    const CanonicalTable t = classifier.classify({"Behaviour", "Discipline Good", "Homework Excellent", "Punctuality g00d"});

    ASSERT_EQ(t.size(), 3u);
    for (const auto& r : t) {
        EXPECT_EQ(r.section, "Behaviour");
        EXPECT_FALSE(r.score.has_value());
    }
    EXPECT_EQ(t[1].label, "Homework");
    EXPECT_EQ(t[1].value.value_or(""), "Excellent");
    EXPECT_EQ(t[2].label, "Punctuality");
    EXPECT_EQ(t[2].value.value_or(""), "g00d");

    ClassifierConfig cfg;
    cfg.lookahead = false;
    SectionClassifier strict(cfg);
    const CanonicalTable s = strict.classify({"Behaviour", "Punctuality g00d"});
    ASSERT_EQ(s.size(), 1u);
    EXPECT_EQ(s[0].label, "Punctuality");
    EXPECT_FALSE(s[0].score.has_value());
}

TEST_F(SectionClassifierTest, LookaheadNeedsANumberOnlyLine) {
    SectionClassifier classifier;
    const CanonicalTable t = classifier.classify({"Subjects", "Homework Done", "History 64/100", "English", "90 of 100"});

    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(t[0].label, "Homework Done");
    EXPECT_FALSE(t[0].score.has_value());
    EXPECT_EQ(t[1].label, "History");
    EXPECT_EQ(t[2].label, "English");
    EXPECT_DOUBLE_EQ(t[2].score.value_or(-1), 90.0);
    EXPECT_DOUBLE_EQ(t[2].maximum.value_or(-1), 100.0);
}

TEST_F(SectionClassifierTest, ScoresUnderBehaviourStayBehaviour) {
    SectionClassifier classifier;
    const CanonicalTable t = classifier.classify({"Co-curricular", "Football 12", "Behaviour", "Discipline 8"});

    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[0].section, "Subjects");
    EXPECT_EQ(t[1].section, "Behaviour");
    EXPECT_DOUBLE_EQ(t[1].score.value_or(-1), 8.0);
}

TEST_F(SectionClassifierTest, UnknownLinesFollowTheCursor) {
    SectionClassifier classifier;
    const CanonicalTable t = classifier.classify({"Academic Report Card", "Co-curricular", "Debate Society"});

    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[0].section, "Misc");
    EXPECT_EQ(t[1].section, "Co-curricular");
    EXPECT_TRUE(t[1].is_misc());
}

TEST_F(SectionClassifierTest, NormalizeTextMatchesClassify) {
    std::string text;
    for (const auto& l : report_lines) text += l + "\n";
    EXPECT_EQ(normalize_text(text).size(), 9u);
}
