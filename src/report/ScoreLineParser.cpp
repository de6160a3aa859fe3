#include "report/ScoreLineParser.hpp"

#include "text/TextUtil.hpp"

#include <iostream>
#include <regex>

namespace report {

// label must end on a non-digit so the score cannot start mid-number
static const std::regex& score_pattern() {
    static const std::regex re(
        R"((.*?[^\d])(?:[:\-]\s*)?)"
        R"((?:(\d{1,3})\s*/\s*(\d{1,4})(?!\d))"
        R"(|(\d{1,3})\s+of\s+(\d{1,4})(?!\d))"
        R"(|(\d{1,3})(?!\d)))",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

static const std::regex& trailing_int_pattern() {
    static const std::regex re(R"(^(.*\S)\s+(\d{1,3})(?!\d))");
    return re;
}

static const std::regex& label_suffix_pattern() {
    static const std::regex re(R"(\b(score|marks|result)\b[:\s\-]*$)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

std::string clean_score_label(const std::string& label) {
    std::string out = std::regex_replace(textutil::trim(label), label_suffix_pattern(), "");
    out = textutil::trim(out);
    while (!out.empty() && (out.back() == ':' || out.back() == '-')) {
        out.pop_back();
        out = textutil::trim(out);
    }
    return out;
}

static std::optional<std::string> non_empty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

std::optional<ScoreLine> parse_score_line(const std::string& line) {
    try {
        std::smatch m;
        if (!std::regex_search(line, m, score_pattern())) return std::nullopt;

        ScoreLine out;
        out.label = non_empty(clean_score_label(m[1].str()));

        if (m[2].matched) {
            out.score = std::stoi(m[2].str());
            out.maximum = std::stoi(m[3].str());
        } else if (m[4].matched) {
            out.score = std::stoi(m[4].str());
            out.maximum = std::stoi(m[5].str());
        } else if (m[6].matched) {
            out.score = std::stoi(m[6].str());
        } else {
            return std::nullopt;
        }
        return out;
    } catch (const std::exception& e) {
        std::cerr << "[warn] score line parse failed: " << e.what() << "\n";
        return std::nullopt;
    }
}

std::optional<ScoreLine> parse_trailing_integer(const std::string& line) {
    try {
        std::smatch m;
        if (!std::regex_search(line, m, trailing_int_pattern())) return std::nullopt;

        ScoreLine out;
        out.label = non_empty(textutil::trim(m[1].str()));
        out.score = std::stoi(m[2].str());
        return out;
    } catch (const std::exception& e) {
        std::cerr << "[warn] trailing integer parse failed: " << e.what() << "\n";
        return std::nullopt;
    }
}

}  // namespace report
