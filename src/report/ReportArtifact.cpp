#include "report/ReportArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace report {

template <typename T>
static nlohmann::json opt(const std::optional<T>& v) {
    if (!v) return nullptr;
    return *v;
}

nlohmann::json record_to_json(const CanonicalRecord& r) {
    nlohmann::json j;
    j["Section"] = r.section;
    j["Label"] = r.label;
    j["Score"] = opt(r.score);
    j["Maximum"] = opt(r.maximum);
    j["Value"] = opt(r.value);
    j["Notes"] = opt(r.notes);
    return j;
}

nlohmann::json table_to_json(const CanonicalTable& table) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : table) arr.push_back(record_to_json(r));
    return arr;
}

nlohmann::json metadata_to_json(const StudentMetadata& md) {
    nlohmann::json j;
    j["Name"] = opt(md.name);
    j["Gender"] = md.gender ? nlohmann::json(gender_str(*md.gender)) : nlohmann::json(nullptr);
    j["State"] = opt(md.state);

    nlohmann::json fields = nlohmann::json::object();
    for (const auto& kv : md.fields) fields[kv.first] = kv.second;
    j["fields"] = fields;
    return j;
}

nlohmann::json statistics_to_json(const StatisticsBundle& s) {
    nlohmann::json j;
    j["row_count"] = s.row_count;
    j["column_count"] = s.column_count;
    j["numeric_columns"] = s.numeric_columns;
    j["averages"] = s.averages;
    j["medians"] = s.medians;
    j["std_dev"] = s.std_dev;
    j["counts"] = s.counts;
    j["trends"] = s.trends;
    j["predictive_insights"] = s.predictive_insights;
    return j;
}

nlohmann::json bundle_to_json(const ReportBundle& b) {
    nlohmann::json j;
    j["table"] = table_to_json(b.table);
    j["metadata"] = metadata_to_json(b.metadata);

    j["subjects"] = b.subjects.subjects;
    nlohmann::json scores = nlohmann::json::object();
    for (const auto& kv : b.subjects.scores.items) scores[kv.first] = kv.second;
    j["subject_scores"] = scores;
    j["strength"] = opt(b.subjects.strength);
    j["weakness"] = opt(b.subjects.weakness);

    j["activities"] = b.activities;

    nlohmann::json behaviour = nlohmann::json::object();
    for (const auto& kv : b.behaviour.items) behaviour[kv.first] = kv.second;
    j["behaviour"] = behaviour;

    nlohmann::json top = nlohmann::json::array();
    for (const auto& e : b.top_scores) top.push_back({{"Label", e.label}, {"Score", e.score}});
    j["top_scores"] = top;

    j["statistics"] = statistics_to_json(b.statistics);
    j["no_extractable_data"] = b.empty();
    return j;
}

nlohmann::json ReportArtifact::to_json() const {
    nlohmann::json j = bundle_to_json(bundle);
    j["source"] = {{"path", source_path}, {"format", source_format}};
    j["config"] = config_to_json(config);
    return j;
}

void ReportArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace report
