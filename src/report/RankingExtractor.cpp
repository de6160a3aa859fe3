#include "report/RankingExtractor.hpp"

#include "report/RecordBuilder.hpp"
#include "report/Vocabulary.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <iostream>
#include <regex>

namespace report {

static bool is_filler(const std::string& w) {
    const auto& fillers = label_filler_words();
    return std::find(fillers.begin(), fillers.end(), textutil::to_lower(w)) != fillers.end();
}

std::string simplify_ranking_label(const std::string& label) {
    const std::string low = textutil::to_lower(textutil::trim(label));

    for (const auto& phrase : two_word_subjects()) {
        if (low.find(phrase) != std::string::npos) return textutil::title_case(phrase);
    }

    const auto words = textutil::split_ws(label);
    if (words.empty()) return textutil::trim(label);

    for (auto it = words.rbegin(); it != words.rend(); ++it) {
        if (!is_filler(*it) && it->size() > 1) return textutil::title_case(*it);
    }
    return textutil::title_case(words.back());
}

static std::vector<std::string> record_cells(const CanonicalRecord& r) {
    std::vector<std::string> cells = {r.section, r.label};
    if (r.score) cells.push_back(format_number(*r.score));
    if (r.maximum) cells.push_back(format_number(*r.maximum));
    if (r.value) cells.push_back(*r.value);
    if (r.notes) cells.push_back(*r.notes);
    return cells;
}

static const std::vector<std::regex>& free_text_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(([a-z\s]+[a-z]):?\s*(\d+)\s*(?:/\s*\d+)?)"),
        std::regex(R"(([a-z\s]+[a-z])\s+(\d+)\s*(?:/\s*\d+)?)"),
        std::regex(R"(([a-z\s]+(?:\([^)]+\))?):?\s*(\d+))"),
    };
    return patterns;
}

static void scan_cell(const std::string& cell, std::vector<RankingEntry>& out) {
    const std::string low = textutil::to_lower(cell);

    for (const auto& re : free_text_patterns()) {
        for (auto it = std::sregex_iterator(low.begin(), low.end(), re); it != std::sregex_iterator(); ++it) {
            const std::string label = textutil::trim((*it)[1].str());
            double score = 0.0;
            if (label.empty() || !textutil::parse_number((*it)[2].str(), score)) continue;
            out.push_back({simplify_ranking_label(label), score});
        }
    }
}

std::vector<RankingEntry> dedup_ranking(std::vector<RankingEntry> entries) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const RankingEntry& a, const RankingEntry& b) { return a.score > b.score; });

    std::vector<RankingEntry> out;
    for (auto& e : entries) {
        const bool seen = std::any_of(out.begin(), out.end(),
                                      [&](const RankingEntry& o) { return o.label == e.label; });
        if (!seen) out.push_back(std::move(e));
    }
    return out;
}

std::vector<RankingEntry> extract_ranking(const CanonicalTable& table) {
    std::vector<RankingEntry> pairs;

    try {
        for (const auto& r : table) {
            if (!r.score || *r.score <= 0) continue;
            const std::string label = textutil::trim(r.label);
            if (label.empty()) continue;
            pairs.push_back({simplify_ranking_label(label), *r.score});
        }

        for (const auto& r : table) {
            for (const auto& cell : record_cells(r)) {
                const std::string t = textutil::trim(cell);
                if (t.empty() || textutil::to_lower(t) == "nan") continue;
                scan_cell(t, pairs);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[warn] ranking extraction failed: " << e.what() << "\n";
        return {};
    }

    return dedup_ranking(std::move(pairs));
}

std::vector<RankingEntry> top_scores(const CanonicalTable& table, size_t n) {
    auto ranking = extract_ranking(table);
    if (ranking.size() > n) ranking.resize(n);
    return ranking;
}

}  // namespace report
