#include "report/OcrReportParser.hpp"

#include "report/EntityExtractor.hpp"
#include "report/SectionClassifier.hpp"
#include "text/TextUtil.hpp"

#include <iostream>
#include <regex>

namespace report {

static CanonicalRecord detail(const std::string& key, const std::string& value) {
    CanonicalRecord r;
    r.section = kSectionStudent;
    r.label = key;
    r.value = value;
    return r;
}

static CanonicalRecord subject_score(const std::smatch& m) {
    CanonicalRecord r;
    r.section = kSectionSubjects;
    r.label = textutil::trim(m[1].str());
    r.score = std::stod(m[2].str());
    r.maximum = std::stod(m[3].str());
    return r;
}

static const std::regex& embedded_score() {
    static const std::regex re(R"(([A-Za-z \t]+?)[ \t]+(\d{1,3})[ \t]*/[ \t]*(\d{1,4})(?!\d))");
    return re;
}

static void parse_columns(const std::string& line, CanonicalTable& out) {
    static const std::regex rating_pair(R"(^([A-Za-z \t]+?)[ \t]+([A-Za-z]+)$)");

    size_t start = 0;
    while (start <= line.size()) {
        size_t bar = line.find('|', start);
        if (bar == std::string::npos) bar = line.size();
        const std::string part = textutil::trim(line.substr(start, bar - start));
        start = bar + 1;
        if (part.empty()) continue;

        std::smatch m;
        if (std::regex_search(part, m, embedded_score())) {
            out.push_back(subject_score(m));
        } else if (std::regex_match(part, m, rating_pair)) {
            CanonicalRecord r;
            r.section = kSectionBehaviour;
            r.label = textutil::trim(m[1].str());
            r.value = m[2].str();
            out.push_back(std::move(r));
        }
    }
}

static bool is_activity_line(const std::string& line) {
    static const char* keywords[] = {"Club", "Winner", "Member", "Team", "Award"};
    for (const char* k : keywords) {
        if (line.find(k) != std::string::npos) return true;
    }
    return false;
}

CanonicalTable parse_ocr_report(const std::string& text) {
    CanonicalTable out;

    try {
        const auto name = extract_name_from_ocr(text);
        if (name) out.push_back(detail("Student Name", *name));

        for (const auto& raw : textutil::split_lines(text)) {
            const std::string line = textutil::trim(raw);
            if (line.empty() || detect_section_header(line)) continue;

            if (line.find('|') != std::string::npos) {
                parse_columns(line, out);
                continue;
            }

            const InlineMetadata md = parse_metadata_line(line);
            for (const auto& kv : md.fields) {
                if (kv.first == "Student Name" && name) continue;
                out.push_back(detail(kv.first, kv.second));
            }

            std::smatch m;
            if (std::regex_search(md.remainder, m, embedded_score())) {
                out.push_back(subject_score(m));
                continue;
            }

            if (is_activity_line(line)) {
                CanonicalRecord r;
                r.section = kSectionCocurricular;
                r.label = line;
                out.push_back(std::move(r));
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[warn] OCR report parse failed: " << e.what() << "\n";
        return {};
    }
    return out;
}

}  // namespace report
