#pragma once
#include <optional>
#include <string>

namespace report {

struct ScoreLine {
    std::optional<std::string> label;  // absent when nothing survives cleanup
    int score = 0;
    std::optional<int> maximum;
};

// Tries, at the leftmost position, "label 74 / 100", "label 74 of 100", then
// "label 74". Score is 1-3 digits and maximum 1-4 digits; a longer digit run
// does not match at all.
std::optional<ScoreLine> parse_score_line(const std::string& line);

// "label ... 74": the last standalone 1-3 digit integer, no maximum.
std::optional<ScoreLine> parse_trailing_integer(const std::string& line);

// strips trailing "score"/"marks"/"result" words and separators
std::string clean_score_label(const std::string& label);

}  // namespace report
