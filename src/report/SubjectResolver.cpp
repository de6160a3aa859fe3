#include "report/SubjectResolver.hpp"

#include "report/Vocabulary.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>

namespace report {

std::optional<std::string> resolve_subject(const std::string& label) {
    const auto toks = textutil::split_ws(label);
    if (toks.empty()) return std::nullopt;

    const std::string last = textutil::to_lower(toks.back());
    if (is_known_subject(last)) return textutil::title_case(last);

    for (const auto& s : known_subjects()) {
        if (textutil::contains_phrase(label, s)) return textutil::title_case(s);
    }
    return std::nullopt;
}

SubjectSummary resolve_subjects(const CanonicalTable& table) {
    SubjectSummary out;

    try {
        for (const auto& r : table) {
            if (textutil::to_lower(r.section).find("subjects") == std::string::npos || !r.score) continue;

            auto subject = resolve_subject(r.label);
            if (!subject) continue;

            out.subjects.push_back(*subject);
            out.scores.set(*subject, *r.score);
        }

        // strict comparisons keep the first maximal/minimal entry
        const std::pair<std::string, double>* best = nullptr;
        const std::pair<std::string, double>* worst = nullptr;
        for (const auto& kv : out.scores.items) {
            if (!best || kv.second > best->second) best = &kv;
            if (!worst || kv.second < worst->second) worst = &kv;
        }
        if (best) out.strength = best->first;
        if (worst) out.weakness = worst->first;
    } catch (const std::exception& e) {
        std::cerr << "[warn] subject resolution failed: " << e.what() << "\n";
        return {};
    }
    return out;
}

static std::vector<std::string> split_parts(const std::string& label) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : label) {
        if (c == '|' || c == '/') {
            parts.push_back(textutil::trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    parts.push_back(textutil::trim(cur));
    return parts;
}

static bool has_cocurricular_keyword(const std::string& part) {
    for (const auto& w : textutil::split_ws(part)) {
        std::string bare;
        for (char c : w) {
            if (std::isalpha(static_cast<unsigned char>(c))) bare.push_back(c);
        }
        if (bare.empty() || !std::isupper(static_cast<unsigned char>(bare[0]))) continue;
        const auto& kw = cocurricular_keywords();
        if (std::find(kw.begin(), kw.end(), textutil::to_lower(bare)) != kw.end()) return true;
    }
    return false;
}

static bool has_metadata_keyword(const std::string& part) {
    for (const auto& t : textutil::tokenize(textutil::normalize(part))) {
        if (is_metadata_keyword(t)) return true;
    }
    return false;
}

std::vector<std::string> extract_activities(const CanonicalTable& table) {
    static const std::regex activity_section(R"(co-?\s?curricular|activit(y|ies))",
                                             std::regex::ECMAScript | std::regex::icase);
    std::vector<std::string> out;

    try {
        for (const auto& r : table) {
            const bool in_section = std::regex_search(r.section, activity_section);

            for (const auto& part : split_parts(r.label)) {
                if (part.empty()) continue;

                const bool keep = has_cocurricular_keyword(part) || (in_section && !has_metadata_keyword(part));
                if (!keep) continue;
                if (std::find(out.begin(), out.end(), part) == out.end()) out.push_back(part);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[warn] activity extraction failed: " << e.what() << "\n";
        return {};
    }
    return out;
}

}  // namespace report
