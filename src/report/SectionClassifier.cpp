#include "report/SectionClassifier.hpp"

#include "report/BehaviourExtractor.hpp"
#include "report/ScoreLineParser.hpp"
#include "report/Vocabulary.hpp"
#include "text/TextUtil.hpp"

#include <cctype>
#include <regex>

namespace report {

std::optional<std::string> detect_section_header(const std::string& line) {
    const std::string low = textutil::to_lower(textutil::collapse_spaces(line));
    if (low.empty()) return std::nullopt;

    for (const auto& a : section_header_aliases()) {
        if (!textutil::starts_with(low, a.alias)) continue;
        // "Behaviour ratings" yes, "Behavioural Science 70/100" no
        if (low.size() == a.alias.size() || !std::isalpha(static_cast<unsigned char>(low[a.alias.size()]))) {
            return a.section;
        }
    }

    // "S u b j e c t s", "Co - Curricular": compare with spacing removed,
    // whole line only, so ordinary data lines are not swallowed
    const std::string packed = textutil::strip_spaces(low);
    for (const auto& a : section_header_aliases()) {
        if (packed == textutil::strip_spaces(a.alias)) return a.section;
    }
    return std::nullopt;
}

std::optional<std::string> detect_metadata_key(const std::string& line) {
    const std::string low = textutil::to_lower(textutil::collapse_spaces(line));
    for (const auto& k : metadata_line_keys()) {
        if (!textutil::starts_with(low, k)) continue;
        // "Form 4" yes, "Formal" no
        if (low.size() == k.size() || !std::isalpha(static_cast<unsigned char>(low[k.size()]))) {
            return k;
        }
    }
    return std::nullopt;
}

SectionClassifier::SectionClassifier(ClassifierConfig cfg) : m_cfg(cfg) {}

std::string SectionClassifier::data_section() const {
    if (m_section && *m_section == kSectionBehaviour) return kSectionBehaviour;
    return kSectionSubjects;
}

std::string SectionClassifier::fallback_section() const {
    return m_section ? *m_section : std::string(kSectionMisc);
}

// "90", "90 / 100", "90 of 100"
static bool is_score_only(const std::string& line) {
    static const std::regex re(R"(^\d{1,3}(?:\s*(?:/|of)\s*\d{1,4})?$)", std::regex::ECMAScript | std::regex::icase);
    return std::regex_match(line, re);
}

static CanonicalRecord score_record(const std::string& section, const ScoreLine& sl, const std::string& raw) {
    CanonicalRecord r;
    r.section = section;
    r.label = sl.label ? *sl.label : raw;
    r.score = static_cast<double>(sl.score);
    if (sl.maximum) r.maximum = static_cast<double>(*sl.maximum);
    return r;
}

CanonicalTable SectionClassifier::classify(const std::vector<std::string>& raw_lines) {
    m_section.reset();

    std::vector<std::string> lines;
    lines.reserve(raw_lines.size());
    for (const auto& l : raw_lines) {
        std::string t = textutil::trim(l);
        if (!t.empty()) lines.push_back(std::move(t));
    }

    CanonicalTable out;
    out.reserve(lines.size());

    size_t i = 0;
    while (i < lines.size()) {
        const std::string& line = lines[i];

        if (auto sec = detect_section_header(line)) {
            m_section = *sec;
            ++i;
            continue;
        }

        if (detect_metadata_key(line)) {
            CanonicalRecord r;
            r.section = kSectionStudent;
            r.label = line;
            out.push_back(std::move(r));
            ++i;
            continue;
        }

        // ratings first: OCR turns "good" into "g00d", which reads as a score
        if (m_section && *m_section == kSectionBehaviour) {
            if (auto kv = split_trailing_rating(line)) {
                CanonicalRecord r;
                r.section = kSectionBehaviour;
                r.label = kv->first;
                r.value = kv->second;
                out.push_back(std::move(r));
                ++i;
                continue;
            }
        }

        if (auto sl = parse_score_line(line)) {
            out.push_back(score_record(data_section(), *sl, line));
            ++i;
            continue;
        }

        // OCR often puts a label and its score on adjacent lines
        if (m_cfg.lookahead && i + 1 < lines.size() && !textutil::has_digit(line) && is_score_only(lines[i + 1])) {
            const std::string combined = line + " " + lines[i + 1];
            if (auto sl = parse_score_line(combined)) {
                out.push_back(score_record(data_section(), *sl, line));
                i += 2;
                continue;
            }
        }

        if (auto sl = parse_trailing_integer(line)) {
            out.push_back(score_record(data_section(), *sl, line));
            ++i;
            continue;
        }

        CanonicalRecord r;
        r.section = fallback_section();
        r.label = line;
        out.push_back(std::move(r));
        ++i;
    }

    return out;
}

}  // namespace report
