#include "report/AnalyzerConfig.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace report {

ClassifierConfig AnalyzerConfig::classifier() const {
    ClassifierConfig c;
    c.lookahead = lookahead;
    return c;
}

BehaviourConfig AnalyzerConfig::behaviour() const {
    BehaviourConfig c;
    c.max_attribute_length = max_attribute_length;
    c.max_fallback_words = max_fallback_words;
    return c;
}

MetadataConfig AnalyzerConfig::metadata() const {
    MetadataConfig c;
    c.name_scan_lines = name_scan_lines;
    return c;
}

static void read_size(const nlohmann::json& j, const char* key, size_t& out) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    if (v.is_number_unsigned()) {
        out = v.get<size_t>();
    } else if (v.is_number_integer() && v.get<long long>() >= 0) {
        out = static_cast<size_t>(v.get<long long>());
    } else {
        std::cerr << "[warn] config key '" << key << "' ignored (expected a non-negative integer)\n";
    }
}

static void read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) return;
    if (j[key].is_boolean()) out = j[key].get<bool>();
    else std::cerr << "[warn] config key '" << key << "' ignored (expected a boolean)\n";
}

void apply_config_json(const nlohmann::json& j, AnalyzerConfig& cfg) {
    if (!j.is_object()) {
        std::cerr << "[warn] config is not a JSON object, using defaults\n";
        return;
    }

    read_size(j, "top_n", cfg.top_n);
    read_bool(j, "lookahead", cfg.lookahead);
    read_size(j, "name_scan_lines", cfg.name_scan_lines);
    read_size(j, "max_attribute_length", cfg.max_attribute_length);
    read_size(j, "max_fallback_words", cfg.max_fallback_words);
    read_bool(j, "certificate_mode", cfg.certificate_mode);

    if (j.contains("text_strategy")) {
        const auto& v = j["text_strategy"];
        if (v.is_string() && (v.get<std::string>() == "lines" || v.get<std::string>() == "ocr_report")) {
            cfg.text_strategy = v.get<std::string>();
        } else {
            std::cerr << "[warn] config key 'text_strategy' ignored (expected \"lines\" or \"ocr_report\")\n";
        }
    }
}

AnalyzerConfig load_analyzer_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open config file: " + path.string());

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in config file " + path.string() + ": " + e.what());
    }

    AnalyzerConfig cfg;
    apply_config_json(j, cfg);
    return cfg;
}

nlohmann::json config_to_json(const AnalyzerConfig& cfg) {
    nlohmann::json j;
    j["top_n"] = cfg.top_n;
    j["lookahead"] = cfg.lookahead;
    j["name_scan_lines"] = cfg.name_scan_lines;
    j["max_attribute_length"] = cfg.max_attribute_length;
    j["max_fallback_words"] = cfg.max_fallback_words;
    j["text_strategy"] = cfg.text_strategy;
    j["certificate_mode"] = cfg.certificate_mode;
    return j;
}

}  // namespace report
