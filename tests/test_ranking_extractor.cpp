#include <gtest/gtest.h>

#include "report/RankingExtractor.hpp"

#include <string>

using namespace report;

static CanonicalRecord scored(const std::string& label, double score) {
    CanonicalRecord r;
    r.section = kSectionSubjects;
    r.label = label;
    r.score = score;
    r.maximum = 100.0;
    return r;
}

TEST(RankingLabelTest, SimplifiesToSubjectWord) {
    EXPECT_EQ(simplify_ranking_label("Bahasa Malaysia Paper 2"), "Bahasa Malaysia");
    EXPECT_EQ(simplify_ranking_label("Marks for Physics"), "Physics");
    EXPECT_EQ(simplify_ranking_label("score in chemistry"), "Chemistry");
    EXPECT_EQ(simplify_ranking_label("Score in A"), "Score");
    EXPECT_EQ(simplify_ranking_label("Chess Club Member"), "Chess Club");
}

TEST(RankingDedupTest, KeepsHighestScorePerLabel) {
    const auto out = dedup_ranking({{"Mathematics", 70}, {"Science", 90}, {"Mathematics", 85}});

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].label, "Science");
    EXPECT_EQ(out[1].label, "Mathematics");
    EXPECT_DOUBLE_EQ(out[1].score, 85.0);
}

TEST(RankingDedupTest, Idempotent) {
    const auto once = dedup_ranking({{"English", 90}, {"History", 60}, {"English", 40}, {"Art", 60}});
    const auto twice = dedup_ranking(once);

    ASSERT_EQ(once.size(), twice.size());
    for (size_t i = 0; i < once.size(); ++i) {
        EXPECT_EQ(once[i].label, twice[i].label);
        EXPECT_DOUBLE_EQ(once[i].score, twice[i].score);
    }
    // equal scores keep encounter order
    EXPECT_EQ(once[1].label, "History");
    EXPECT_EQ(once[2].label, "Art");
}

TEST(RankingExtractorTest, StructuredScoresSkipZero) {
    const CanonicalTable t = {scored("Mathematics", 85), scored("Art", 0), scored("English", 90)};

    const auto ranking = extract_ranking(t);
    ASSERT_EQ(ranking.size(), 2u);
    EXPECT_EQ(ranking[0].label, "English");
    EXPECT_EQ(ranking[1].label, "Mathematics");
}

TEST(RankingExtractorTest, PicksPairsOutOfFreeText) {
    CanonicalRecord remark;
    remark.section = kSectionMisc;
    remark.label = "Remarks";
    remark.value = "Physics 72";

    const CanonicalTable t = {scored("Mathematics", 85), remark};

    const auto ranking = extract_ranking(t);
    ASSERT_EQ(ranking.size(), 2u);
    EXPECT_EQ(ranking[0].label, "Mathematics");
    EXPECT_EQ(ranking[1].label, "Physics");
    EXPECT_DOUBLE_EQ(ranking[1].score, 72.0);
}

TEST(RankingExtractorTest, TopScoresTruncates) {
    const CanonicalTable t = {scored("Mathematics", 85), scored("Science", 78), scored("English", 90)};

    const auto top = top_scores(t, 2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].label, "English");
    EXPECT_EQ(top[1].label, "Mathematics");

    EXPECT_EQ(top_scores(t).size(), 3u);
    EXPECT_TRUE(top_scores({}).empty());
}
