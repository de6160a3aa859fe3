#include "report/BundleValidator.hpp"

#include "report/Vocabulary.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace fs = std::filesystem;

namespace report {

static void add_error(ValidationReport& rep, const std::string& code, const std::string& msg, const std::string& field = "") {
    rep.pass = false;
    ValidationError e;
    e.code = code;
    e.message = msg;
    e.field = field;
    rep.errors.push_back(std::move(e));
}

static bool null_or_number(const nlohmann::json& j) {
    return j.is_null() || (j.is_number() && j.get<double>() >= 0.0);
}

static bool null_or_string(const nlohmann::json& j) {
    return j.is_null() || j.is_string();
}

static void check_table(const nlohmann::json& table, ValidationReport& rep) {
    static const char* columns[] = {"Section", "Label", "Score", "Maximum", "Value", "Notes"};

    for (size_t i = 0; i < table.size(); ++i) {
        const auto& r = table[i];
        const std::string where = "table[" + std::to_string(i) + "]";
        if (!r.is_object()) {
            add_error(rep, "bad_type", "record is not an object", where);
            continue;
        }
        for (const char* c : columns) {
            if (!r.contains(c)) add_error(rep, "missing_field", std::string("record lacks ") + c, where);
        }
        if (r.contains("Section") && !r["Section"].is_string()) add_error(rep, "bad_type", "Section must be a string", where);
        if (r.contains("Label") && !r["Label"].is_string()) add_error(rep, "bad_type", "Label must be a string", where);
        if (r.contains("Score") && !null_or_number(r["Score"])) add_error(rep, "bad_type", "Score must be null or a non-negative number", where);
        if (r.contains("Maximum") && !null_or_number(r["Maximum"])) add_error(rep, "bad_type", "Maximum must be null or a non-negative number", where);
        if (r.contains("Value") && !null_or_string(r["Value"])) add_error(rep, "bad_type", "Value must be null or a string", where);
        if (r.contains("Notes") && !null_or_string(r["Notes"])) add_error(rep, "bad_type", "Notes must be null or a string", where);
    }
}

static void check_behaviour(const nlohmann::json& behaviour, ValidationReport& rep) {
    const auto& ratings = canonical_ratings();
    for (auto it = behaviour.begin(); it != behaviour.end(); ++it) {
        const std::string& attr = it.key();
        if (textutil::has_digit(attr)) add_error(rep, "bad_behaviour", "attribute contains a digit: " + attr, "behaviour");
        if (attr.size() > 60) add_error(rep, "bad_behaviour", "attribute longer than 60 characters: " + attr, "behaviour");

        const auto& v = it.value();
        if (!v.is_string() || std::find(ratings.begin(), ratings.end(), v.get<std::string>()) == ratings.end()) {
            add_error(rep, "bad_behaviour", "rating is not canonical for: " + attr, "behaviour");
        }
    }
}

static void check_ranking(const nlohmann::json& top, ValidationReport& rep) {
    std::unordered_set<std::string> seen;
    double prev = 0.0;
    bool first = true;

    for (const auto& e : top) {
        if (!e.is_object() || !e.contains("Label") || !e["Label"].is_string() ||
            !e.contains("Score") || !e["Score"].is_number()) {
            add_error(rep, "bad_type", "top_scores entry needs a string Label and a numeric Score", "top_scores");
            continue;
        }
        const std::string label = e["Label"].get<std::string>();
        const double score = e["Score"].get<double>();

        if (!seen.insert(label).second) add_error(rep, "duplicate_label", "label ranked twice: " + label, "top_scores");
        if (!first && score > prev) add_error(rep, "ranking_order", "top_scores not in descending order at " + label, "top_scores");
        prev = score;
        first = false;
    }
}

static void check_extremes(const nlohmann::json& j, ValidationReport& rep) {
    const auto& scores = j["subject_scores"];
    for (const char* key : {"strength", "weakness"}) {
        const auto& v = j[key];
        if (v.is_null()) {
            if (!scores.empty()) add_error(rep, "inconsistent_summary", std::string(key) + " missing while subject_scores is not empty", key);
            continue;
        }
        if (!v.is_string() || !scores.contains(v.get<std::string>())) {
            add_error(rep, "inconsistent_summary", std::string(key) + " is not one of subject_scores", key);
        }
    }
}

ValidationReport validate_bundle(const nlohmann::json& j) {
    ValidationReport rep;

    if (!j.is_object()) {
        add_error(rep, "bad_type", "bundle is not a JSON object");
        return rep;
    }

    struct Required {
        const char* key;
        nlohmann::json::value_t type;
    };
    static const Required required[] = {
        {"table", nlohmann::json::value_t::array},
        {"metadata", nlohmann::json::value_t::object},
        {"subjects", nlohmann::json::value_t::array},
        {"subject_scores", nlohmann::json::value_t::object},
        {"activities", nlohmann::json::value_t::array},
        {"behaviour", nlohmann::json::value_t::object},
        {"top_scores", nlohmann::json::value_t::array},
        {"statistics", nlohmann::json::value_t::object},
        {"no_extractable_data", nlohmann::json::value_t::boolean},
    };

    for (const auto& r : required) {
        if (!j.contains(r.key)) add_error(rep, "missing_field", std::string("missing ") + r.key, r.key);
        else if (j[r.key].type() != r.type) add_error(rep, "bad_type", std::string("wrong type for ") + r.key, r.key);
    }
    for (const char* key : {"strength", "weakness"}) {
        if (!j.contains(key)) add_error(rep, "missing_field", std::string("missing ") + key, key);
        else if (!null_or_string(j[key])) add_error(rep, "bad_type", std::string("wrong type for ") + key, key);
    }
    if (!rep.pass) return rep;

    const auto& md = j["metadata"];
    for (const char* key : {"Name", "Gender", "State"}) {
        if (!md.contains(key) || !null_or_string(md[key])) add_error(rep, "bad_type", std::string("metadata.") + key + " must be null or a string", "metadata");
    }
    if (md.contains("Gender") && md["Gender"].is_string()) {
        const std::string g = md["Gender"].get<std::string>();
        if (g != "Male" && g != "Female") add_error(rep, "bad_metadata", "Gender must be Male or Female", "metadata");
    }

    const auto& stats = j["statistics"];
    for (const char* key : {"row_count", "column_count", "numeric_columns", "averages", "medians",
                            "std_dev", "counts", "trends", "predictive_insights"}) {
        if (!stats.contains(key)) add_error(rep, "missing_field", std::string("missing statistics.") + key, "statistics");
    }
    if (stats.contains("row_count") && stats["row_count"].is_number_integer() &&
        stats["row_count"].get<long long>() != static_cast<long long>(j["table"].size())) {
        add_error(rep, "inconsistent_summary", "statistics.row_count differs from the table size", "statistics");
    }

    check_table(j["table"], rep);
    check_behaviour(j["behaviour"], rep);
    check_ranking(j["top_scores"], rep);
    check_extremes(j, rep);

    return rep;
}

ValidationReport validate_bundle_file(const fs::path& path) {
    ValidationReport rep;

    if (!fs::exists(path)) {
        add_error(rep, "missing_file", "bundle file does not exist: " + path.string());
        return rep;
    }

    nlohmann::json j;
    try {
        std::ifstream in(path);
        if (!in) throw std::runtime_error("Failed to open JSON file: " + path.string());
        in >> j;
    } catch (const std::exception& e) {
        add_error(rep, "json_parse_error", e.what());
        return rep;
    }

    return validate_bundle(j);
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    nlohmann::json j;
    j["pass"] = rep.pass;
    j["errors"] = nlohmann::json::array();

    for (const auto& e : rep.errors) {
        nlohmann::json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        if (!e.field.empty()) ej["field"] = e.field;
        j["errors"].push_back(ej);
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << j.dump(2) << "\n";
}

}  // namespace report
