#include "commands/common.hpp"

#include "report/RecordBuilder.hpp"

#include <filesystem>
#include <stdexcept>

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid integer for " + key + ": " + s);
    }
}

report::AnalyzerConfig config_from_args(int argc, char** argv) {
    const std::string config_path = get_arg(argc, argv, "--config", "");
    report::AnalyzerConfig cfg = config_path.empty() ? report::AnalyzerConfig{} : report::load_analyzer_config(config_path);

    const int topn = get_arg_int(argc, argv, "--topn", static_cast<int>(cfg.top_n));
    if (topn < 0) throw std::runtime_error("--topn must be non-negative");
    cfg.top_n = static_cast<size_t>(topn);

    if (has_flag(argc, argv, "--no_lookahead")) cfg.lookahead = false;
    if (has_flag(argc, argv, "--ocr_report")) cfg.text_strategy = "ocr_report";
    if (has_flag(argc, argv, "--certificate")) cfg.certificate_mode = true;
    return cfg;
}

std::string detect_format(const std::string& path, const std::string& format_arg) {
    if (!format_arg.empty()) {
        if (format_arg != "text" && format_arg != "table") {
            throw std::runtime_error("unknown --format: " + format_arg + " (expected text or table)");
        }
        return format_arg;
    }
    return std::filesystem::path(path).extension() == ".json" ? "table" : "text";
}

void print_bundle_summary(std::ostream& os, const report::ReportBundle& b) {
    os << "RECORDS: " << b.table.size() << "\n";

    if (b.empty()) {
        os << "NO_EXTRACTABLE_DATA: true\n";
        return;
    }

    const auto& md = b.metadata;
    os << "NAME: " << (md.name ? *md.name : "-") << "\n";
    os << "GENDER: " << (md.gender ? report::gender_str(*md.gender) : "-") << "\n";
    os << "STATE: " << (md.state ? *md.state : "-") << "\n";
    for (const auto& kv : md.fields) os << "FIELD: " << kv.first << " = " << kv.second << "\n";

    os << "SUBJECTS: " << b.subjects.scores.size() << "\n";
    for (const auto& kv : b.subjects.scores.items) {
        os << "  " << kv.first << ": " << report::format_number(kv.second) << "\n";
    }
    if (b.subjects.strength) os << "STRENGTH: " << *b.subjects.strength << "\n";
    if (b.subjects.weakness) os << "WEAKNESS: " << *b.subjects.weakness << "\n";

    os << "ACTIVITIES: " << b.activities.size() << "\n";
    for (const auto& a : b.activities) os << "  - " << a << "\n";

    os << "BEHAVIOUR: " << b.behaviour.size() << "\n";
    for (const auto& kv : b.behaviour.items) os << "  " << kv.first << ": " << kv.second << "\n";

    os << "TOP_SCORES: " << b.top_scores.size() << "\n";
    for (size_t i = 0; i < b.top_scores.size(); ++i) {
        os << "  " << (i + 1) << ". " << b.top_scores[i].label << " " << report::format_number(b.top_scores[i].score) << "\n";
    }

    for (const auto& kv : b.statistics.averages) {
        os << "AVG_" << kv.first << ": " << kv.second << "\n";
    }
    for (const auto& kv : b.statistics.trends) {
        os << "TREND_" << kv.first << ": " << kv.second << "\n";
    }
    for (const auto& kv : b.statistics.predictive_insights) {
        os << "INSIGHT_" << kv.first << ": " << kv.second << "\n";
    }
}
