#pragma once
#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "report/BehaviourExtractor.hpp"
#include "report/EntityExtractor.hpp"
#include "report/SectionClassifier.hpp"

namespace report {

struct AnalyzerConfig {
    size_t top_n = 5;
    bool lookahead = true;
    size_t name_scan_lines = 20;
    size_t max_attribute_length = 60;
    size_t max_fallback_words = 5;
    std::string text_strategy = "lines";  // "lines" | "ocr_report"
    bool certificate_mode = false;        // fall back to the certificate recipient for the name

    ClassifierConfig classifier() const;
    BehaviourConfig behaviour() const;
    MetadataConfig metadata() const;
};

// Overlays the keys present in j onto cfg. Unknown keys are ignored and a
// value of the wrong type leaves the default in place.
void apply_config_json(const nlohmann::json& j, AnalyzerConfig& cfg);

// throws std::runtime_error when the file is missing or not valid JSON
AnalyzerConfig load_analyzer_config(const std::filesystem::path& path);

nlohmann::json config_to_json(const AnalyzerConfig& cfg);

}  // namespace report
