#pragma once
#include <optional>
#include <string>
#include <vector>

#include "report/Models.hpp"
#include "report/SectionClassifier.hpp"

namespace report {

// numeric cell -> number; anything else (including empty) -> nothing
std::optional<double> coerce_number(const Cell& cell);

// One line per row: a single column yields its non-empty cells, several
// columns yield the row's non-empty cells joined with a space.
std::vector<std::string> table_to_lines(const SourceTable& table);

// Tables with explicit Section and Label columns pass straight through with
// Score/Maximum coerced; everything else goes through the classifier.
CanonicalTable normalize_table(const SourceTable& table, const ClassifierConfig& cfg = {});

CanonicalTable normalize_lines(const std::vector<std::string>& lines, const ClassifierConfig& cfg = {});
CanonicalTable normalize_text(const std::string& text, const ClassifierConfig& cfg = {});

// 74 -> "74", 74.5 -> "74.5"
std::string format_number(double v);

}  // namespace report
