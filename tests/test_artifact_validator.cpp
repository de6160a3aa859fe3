#include <gtest/gtest.h>

#include "report/AnalyzerConfig.hpp"
#include "report/BundleValidator.hpp"
#include "report/ReportAnalyzer.hpp"
#include "report/ReportArtifact.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using namespace report;

static bool has_code(const ValidationReport& rep, const std::string& code) {
    for (const auto& e : rep.errors) {
        if (e.code == code) return true;
    }
    return false;
}

class BundleValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / "report_agent_validator_test";
        fs::remove_all(dir);
        fs::create_directories(dir);

        bundle = analyze_text(
            "Student Details\n"
            "Name: Ahmad Daniel\n"
            "Gender: Male\n"
            "Subjects\n"
            "Mathematics 85/100\n"
            "Science 78/100\n"
            "Behaviour\n"
            "Punctuality Good\n");
    }

    void TearDown() override { fs::remove_all(dir); }

    fs::path dir;
    ReportBundle bundle;
};

TEST_F(BundleValidatorTest, AnalyzerOutputPasses) {
    const nlohmann::json j = bundle_to_json(bundle);

    const ValidationReport rep = validate_bundle(j);
    EXPECT_TRUE(rep.pass);
    EXPECT_TRUE(rep.errors.empty());

    EXPECT_EQ(j["metadata"]["Name"], "Ahmad Daniel");
    EXPECT_EQ(j["metadata"]["Gender"], "Male");
    EXPECT_TRUE(j["metadata"]["State"].is_null());
    EXPECT_EQ(j["subject_scores"]["Mathematics"], 85.0);
    EXPECT_EQ(j["top_scores"][0]["Label"], "Mathematics");
    EXPECT_FALSE(j["no_extractable_data"].get<bool>());
}

TEST_F(BundleValidatorTest, MissingFieldFails) {
    nlohmann::json j = bundle_to_json(bundle);
    j.erase("table");

    const ValidationReport rep = validate_bundle(j);
    EXPECT_FALSE(rep.pass);
    EXPECT_TRUE(has_code(rep, "missing_field"));
}

TEST_F(BundleValidatorTest, BehaviourAttributesAndRatingsAreChecked) {
    nlohmann::json j = bundle_to_json(bundle);
    j["behaviour"]["Test 1"] = "Good";
    j["behaviour"]["Homework"] = "Superb";

    const ValidationReport rep = validate_bundle(j);
    EXPECT_FALSE(rep.pass);
    EXPECT_TRUE(has_code(rep, "bad_behaviour"));
}

TEST_F(BundleValidatorTest, RankingMustDescend) {
    nlohmann::json j = bundle_to_json(bundle);
    j["top_scores"] = nlohmann::json::array({
        {{"Label", "Science"}, {"Score", 78}},
        {{"Label", "Mathematics"}, {"Score", 85}},
        {{"Label", "Science"}, {"Score", 60}},
    });

    const ValidationReport rep = validate_bundle(j);
    EXPECT_TRUE(has_code(rep, "ranking_order"));
    EXPECT_TRUE(has_code(rep, "duplicate_label"));
}

TEST_F(BundleValidatorTest, SummaryMustMatchScores) {
    nlohmann::json j = bundle_to_json(bundle);
    j["strength"] = "Art";
    j["metadata"]["Gender"] = "Unknown";
    j["statistics"]["row_count"] = 99;

    const ValidationReport rep = validate_bundle(j);
    EXPECT_TRUE(has_code(rep, "inconsistent_summary"));
    EXPECT_TRUE(has_code(rep, "bad_metadata"));
}

TEST_F(BundleValidatorTest, ArtifactRoundTripsThroughFile) {
    ReportArtifact art;
    art.source_path = "card.txt";
    art.source_format = "text";
    art.bundle = bundle;

    const fs::path out = dir / "nested" / "card.json";
    art.write_to(out);
    ASSERT_TRUE(fs::exists(out));

    const ValidationReport rep = validate_bundle_file(out);
    EXPECT_TRUE(rep.pass);

    std::ifstream in(out);
    nlohmann::json j;
    in >> j;
    EXPECT_EQ(j["source"]["format"], "text");
    EXPECT_EQ(j["config"]["top_n"], 5);
}

TEST_F(BundleValidatorTest, UnreadableFilesAreReportedNotThrown) {
    const ValidationReport missing = validate_bundle_file(dir / "nope.json");
    EXPECT_FALSE(missing.pass);
    EXPECT_TRUE(has_code(missing, "missing_file"));

    const fs::path broken = dir / "broken.json";
    std::ofstream(broken) << "{ not json";
    const ValidationReport bad = validate_bundle_file(broken);
    EXPECT_FALSE(bad.pass);
    EXPECT_TRUE(has_code(bad, "json_parse_error"));

    const fs::path report_path = dir / "reports" / "validation_report.json";
    write_validation_report(report_path, bad);
    std::ifstream in(report_path);
    nlohmann::json j;
    in >> j;
    EXPECT_FALSE(j["pass"].get<bool>());
    EXPECT_EQ(j["errors"][0]["code"], "json_parse_error");
}

TEST(AnalyzerConfigTest, OverlaysKnownKeys) {
    AnalyzerConfig cfg;
    apply_config_json(nlohmann::json{{"top_n", 3}, {"lookahead", false}, {"text_strategy", "ocr_report"}, {"unknown", 1}}, cfg);

    EXPECT_EQ(cfg.top_n, 3u);
    EXPECT_FALSE(cfg.lookahead);
    EXPECT_FALSE(cfg.classifier().lookahead);
    EXPECT_EQ(cfg.text_strategy, "ocr_report");
    EXPECT_EQ(cfg.name_scan_lines, 20u);
}

TEST(AnalyzerConfigTest, WrongTypesKeepDefaults) {
    AnalyzerConfig cfg;
    apply_config_json(nlohmann::json{{"top_n", "ten"}, {"max_fallback_words", -2},
                                     {"text_strategy", "pdf"}, {"certificate_mode", 1}}, cfg);

    EXPECT_EQ(cfg.top_n, 5u);
    EXPECT_EQ(cfg.behaviour().max_fallback_words, 5u);
    EXPECT_EQ(cfg.text_strategy, "lines");
    EXPECT_FALSE(cfg.certificate_mode);
}

TEST(AnalyzerConfigTest, MissingFileThrows) {
    EXPECT_THROW(load_analyzer_config("/nonexistent/report_agent.json"), std::runtime_error);
}
