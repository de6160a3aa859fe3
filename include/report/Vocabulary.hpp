#pragma once
#include <string>
#include <unordered_map>
#include <vector>

// Static dictionaries shared by every extractor. All entries are lower-case;
// lookups fold the query to lower-case first. Tables are built once on first
// use and never mutated, so concurrent readers need no locking.

namespace report {

struct HeaderAlias {
    std::string alias;    // lower-case, single-spaced
    std::string section;  // canonical section tag
};

// Known subjects, longest entry first so that substring scans prefer
// "additional mathematics" over "math".
const std::vector<std::string>& known_subjects();
bool is_known_subject(const std::string& word);

// Multi-word subjects and activity phrases the ranking keeps whole.
const std::vector<std::string>& two_word_subjects();

const std::vector<std::string>& metadata_keywords();
bool is_metadata_keyword(const std::string& word);

const std::vector<std::string>& common_english_words();

const std::vector<std::string>& cocurricular_keywords();

// metadata keywords | known subjects | co-curricular keywords | common words
bool is_stop_word(const std::string& token);

// Line prefixes that mark a metadata line, longest first.
const std::vector<std::string>& metadata_line_keys();

const std::vector<HeaderAlias>& section_header_aliases();

// Excellent, Very Good, Good, Fair, Poor, Bad (containment-check order)
const std::vector<std::string>& canonical_ratings();

// OCR variants and synonyms -> canonical rating
const std::unordered_map<std::string, std::string>& rating_variants();

// every token the text extractor recognizes as a rating, longest first
const std::vector<std::string>& rating_tokens();

const std::vector<std::string>& malaysian_states();

// words skipped when shortening a ranking label to its "main" word
const std::vector<std::string>& label_filler_words();

}  // namespace report
