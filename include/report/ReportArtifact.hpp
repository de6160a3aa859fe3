#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "report/AnalyzerConfig.hpp"
#include "report/Models.hpp"

namespace report {

nlohmann::json record_to_json(const CanonicalRecord& r);
nlohmann::json table_to_json(const CanonicalTable& table);
nlohmann::json metadata_to_json(const StudentMetadata& md);
nlohmann::json statistics_to_json(const StatisticsBundle& s);

// The bundle under its fixed field names (table, metadata, subjects, ...).
nlohmann::json bundle_to_json(const ReportBundle& b);

struct ReportArtifact {
    std::string source_path;
    std::string source_format;  // "text" | "table"
    AnalyzerConfig config;

    ReportBundle bundle;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace report
