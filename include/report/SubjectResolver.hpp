#pragma once
#include <optional>
#include <string>
#include <vector>

#include "report/Models.hpp"

namespace report {

// Canonical subject for a label: the last token when it is a known subject,
// otherwise the first vocabulary phrase (longest first) found as whole words.
// Title-cased; nothing when the label names no known subject.
std::optional<std::string> resolve_subject(const std::string& label);

// Scans Subjects records that carry a score. Unmatched labels stay in the
// table but are left out of the map.
SubjectSummary resolve_subjects(const CanonicalTable& table);

// Club, team and award lines, plus anything listed under a co-curricular
// section. Order of first appearance, no duplicates.
std::vector<std::string> extract_activities(const CanonicalTable& table);

}  // namespace report
