#include "report/Vocabulary.hpp"

#include "text/TextUtil.hpp"

#include <algorithm>
#include <unordered_set>

namespace report {

static std::vector<std::string> longest_first(std::vector<std::string> v) {
    std::stable_sort(v.begin(), v.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    return v;
}

static bool contains_word(const std::vector<std::string>& list, const std::string& word) {
    const std::string w = textutil::to_lower(textutil::trim(word));
    if (w.empty()) return false;
    return std::find(list.begin(), list.end(), w) != list.end();
}

const std::vector<std::string>& known_subjects() {
    static const std::vector<std::string> subjects = longest_first({
        "mathematics", "math", "maths", "science", "physics", "chemistry",
        "biology", "history", "geography", "english", "language", "languages",
        "malay", "bahasa", "chinese", "mandarin", "tamil", "arabic",
        "physical education", "pe", "art", "music", "literature",
        "economics", "accounting", "business", "computer", "ict",
        "additional mathematics", "add math", "moral", "pendidikan",
        "sejarah", "sains", "matematik",
    });
    return subjects;
}

bool is_known_subject(const std::string& word) {
    return contains_word(known_subjects(), word);
}

const std::vector<std::string>& two_word_subjects() {
    static const std::vector<std::string> subjects = {
        "bahasa malaysia",
        "physical education",
        "social science",
        "computer science",
        "moral education",
        "additional mathematics",
        "general science",
        "environmental science",
        "information technology",
        "class participation",
        "community service",
        "chess club",
        "football",
        "club",
        "sejarah (history)",
    };
    return subjects;
}

const std::vector<std::string>& metadata_keywords() {
    static const std::vector<std::string> words = {
        "name", "student", "school", "state", "gender", "male", "female",
        "form", "level", "nationality", "class", "grade", "section", "age",
        "year", "date", "address", "phone", "email", "behaviour", "behavior",
        "attentiveness", "participation", "attendance", "punctuality",
        "discipline", "ratings", "father", "mother", "guardian", "parent",
        "contact", "code", "id", "number", "admission", "roll",
    };
    return words;
}

bool is_metadata_keyword(const std::string& word) {
    return contains_word(metadata_keywords(), word);
}

const std::vector<std::string>& common_english_words() {
    static const std::vector<std::string> words = {
        "name", "student", "school", "state", "gender", "male", "female",
        "form", "level", "nationality", "secondary", "primary", "class",
        "grade", "section", "age", "year", "date", "address", "phone",
        "email", "father", "mother", "guardian", "contact", "code",
    };
    return words;
}

const std::vector<std::string>& cocurricular_keywords() {
    static const std::vector<std::string> words = {
        "member", "club", "society", "team", "day", "competition",
        "event", "activity", "activities", "award", "prize",
        "position", "role", "committee", "group", "association",
    };
    return words;
}

bool is_stop_word(const std::string& token) {
    static const std::unordered_set<std::string> stop = [] {
        std::unordered_set<std::string> s;
        for (const auto& w : metadata_keywords()) s.insert(w);
        for (const auto& w : known_subjects()) s.insert(w);
        for (const auto& w : cocurricular_keywords()) s.insert(w);
        for (const auto& w : common_english_words()) s.insert(w);
        return s;
    }();
    return stop.count(textutil::to_lower(textutil::trim(token))) > 0;
}

const std::vector<std::string>& metadata_line_keys() {
    static const std::vector<std::string> keys = longest_first({
        "name", "student name", "gender", "state", "school", "school level",
        "form", "attendance", "nationality",
    });
    return keys;
}

const std::vector<HeaderAlias>& section_header_aliases() {
    static const std::vector<HeaderAlias> aliases = {
        {"subject scores", "Subjects"},
        {"subjects", "Subjects"},
        {"behaviour", "Behaviour"},
        {"behavior", "Behaviour"},
        {"ratings", "Behaviour"},
        {"co-curricular", "Co-curricular"},
        {"co curricular", "Co-curricular"},
        {"cocurricular", "Co-curricular"},
        {"student details", "Student Details"},
        {"student information", "Student Details"},
        {"student betalls", "Student Details"},
    };
    return aliases;
}

const std::vector<std::string>& canonical_ratings() {
    // "Very Good" before "Good" so containment picks the longer one
    static const std::vector<std::string> ratings = {
        "Excellent", "Very Good", "Good", "Fair", "Poor", "Bad",
    };
    return ratings;
}

const std::unordered_map<std::string, std::string>& rating_variants() {
    static const std::unordered_map<std::string, std::string> variants = {
        {"g00d", "Good"}, {"g0od", "Good"}, {"go0d", "Good"},
        {"0k", "Fair"}, {"very good", "Very Good"}, {"verygood", "Very Good"},
        {"excellent", "Excellent"}, {"good", "Good"}, {"fair", "Fair"},
        {"average", "Fair"}, {"avg", "Fair"}, {"ok", "Fair"}, {"okay", "Fair"},
        {"poor", "Poor"}, {"p00r", "Poor"}, {"bad", "Bad"}, {"b4d", "Bad"}, {"b@d", "Bad"},
        {"satisfactory", "Good"}, {"unsatisfactory", "Poor"},
    };
    return variants;
}

const std::vector<std::string>& rating_tokens() {
    static const std::vector<std::string> tokens = [] {
        std::vector<std::string> out;
        for (const auto& kv : rating_variants()) out.push_back(kv.first);
        for (const auto& r : canonical_ratings()) out.push_back(textutil::to_lower(r));
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        return longest_first(out);
    }();
    return tokens;
}

const std::vector<std::string>& malaysian_states() {
    static const std::vector<std::string> states = {
        "Negeri Sembilan", "Kuala Lumpur",
        "Selangor", "Johor", "Penang", "Perak", "Kedah",
        "Kelantan", "Terengganu", "Pahang", "Melaka",
        "Sabah", "Sarawak", "Perlis", "Putrajaya", "Labuan",
    };
    return states;
}

const std::vector<std::string>& label_filler_words() {
    static const std::vector<std::string> words = {
        "and", "the", "for", "with", "in", "on", "at", "to", "of",
    };
    return words;
}

}  // namespace report
