#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "report/Models.hpp"

namespace report {

struct BehaviourConfig {
    size_t max_attribute_length = 60;
    size_t max_fallback_words = 5;  // words collected backwards from a rating
};

// Canonical rating for a raw token, trying in order: exact canonical match,
// variant table, OCR character repair (0->o 1->l 5->s @/4->a $->s), then
// containment of a canonical rating. Nothing when all four miss.
std::optional<std::string> normalize_rating(const std::string& token);

// "self-control!!" -> "Self-Control"
std::string clean_attribute(const std::string& attr);

// "Punctuality  Very Good" -> {"Punctuality", "Very Good"}; the raw rating
// token is returned untouched. Only exact/variant/repaired tokens count.
std::optional<std::pair<std::string, std::string>> split_trailing_rating(const std::string& line);

// Rows whose section mentions behaviour: Label -> normalized Value.
BehaviourTraitMap extract_behaviour_from_records(const CanonicalTable& table, const BehaviourConfig& cfg = {});

// Strict "attribute rating" regex pass; when that finds nothing, walk back
// from each rating token to collect the attribute words.
BehaviourTraitMap extract_behaviour_from_text(const std::string& text, const BehaviourConfig& cfg = {});

// Structured rows first; the text is only consulted when they yield nothing.
BehaviourTraitMap extract_behaviour(const CanonicalTable& table, const std::string& text,
                                    const BehaviourConfig& cfg = {});

std::map<std::string, std::vector<std::string>> group_traits_by_rating(const BehaviourTraitMap& traits);

}  // namespace report
