#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace report {

// Section tags. These strings are part of the output contract.
inline constexpr const char* kSectionStudent = "Student Details";
inline constexpr const char* kSectionSubjects = "Subjects";
inline constexpr const char* kSectionBehaviour = "Behaviour";
inline constexpr const char* kSectionCocurricular = "Co-curricular";
inline constexpr const char* kSectionMisc = "Misc";

struct CanonicalRecord {
    std::string section;
    std::string label;
    std::optional<double> score;
    std::optional<double> maximum;
    std::optional<std::string> value;
    std::optional<std::string> notes;

    // neither a score nor a value: kept for traceability only
    bool is_misc() const { return !score && !value; }
};

using CanonicalTable = std::vector<CanonicalRecord>;

using Cell = std::optional<std::string>;

// What the loading collaborator hands over for tabular documents.
struct SourceTable {
    std::vector<std::string> columns;
    std::vector<std::vector<Cell>> rows;

    // label/value pairs the loader found above the header row
    std::vector<std::pair<std::string, std::string>> metadata;

    int column_index(const std::string& name) const;  // -1 when absent
    bool has_column(const std::string& name) const { return column_index(name) >= 0; }
};

enum class Gender {
    Male,
    Female
};

const char* gender_str(Gender g);

struct StudentMetadata {
    std::optional<std::string> name;
    std::optional<Gender> gender;
    std::optional<std::string> state;

    // free-form fields in discovery order (Nationality, Form, School Level, ...)
    std::vector<std::pair<std::string, std::string>> fields;

    bool empty() const { return !name && !gender && !state && fields.empty(); }

    // first-match-wins; returns false if the key was already set
    bool set_field(const std::string& key, const std::string& value);
    const std::string* field(const std::string& key) const;
};

// Insertion-ordered map: a repeated key overwrites its value in place.
template <typename V>
struct OrderedMap {
    std::vector<std::pair<std::string, V>> items;

    void set(const std::string& key, const V& v) {
        for (auto& kv : items) {
            if (kv.first == key) {
                kv.second = v;
                return;
            }
        }
        items.emplace_back(key, v);
    }

    const V* find(const std::string& key) const {
        for (const auto& kv : items) {
            if (kv.first == key) return &kv.second;
        }
        return nullptr;
    }

    bool empty() const { return items.empty(); }
    size_t size() const { return items.size(); }
};

// canonical subject -> score, last-seen value wins
using SubjectScoreMap = OrderedMap<double>;

// attribute -> canonical rating
using BehaviourTraitMap = OrderedMap<std::string>;

struct SubjectSummary {
    std::vector<std::string> subjects;  // every accepted label, in encounter order
    SubjectScoreMap scores;
    std::optional<std::string> strength;
    std::optional<std::string> weakness;
};

struct RankingEntry {
    std::string label;
    double score = 0.0;
};

struct StatisticsBundle {
    int row_count = 0;
    int column_count = 0;
    std::vector<std::string> numeric_columns;

    std::map<std::string, double> averages;
    std::map<std::string, double> medians;
    std::map<std::string, double> std_dev;
    std::map<std::string, int> counts;

    std::map<std::string, std::string> trends;
    std::map<std::string, std::string> predictive_insights;
};

struct ReportBundle {
    CanonicalTable table;
    StudentMetadata metadata;
    SubjectSummary subjects;
    std::vector<std::string> activities;
    BehaviourTraitMap behaviour;
    std::vector<RankingEntry> top_scores;
    StatisticsBundle statistics;

    bool empty() const { return table.empty() && metadata.empty(); }
};

}  // namespace report
