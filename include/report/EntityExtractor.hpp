#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "report/Models.hpp"

namespace report {

// "Name: Ahmad Daniel Languages 74/100" -> "Ahmad Daniel". Capitalized tokens
// after a (Student) Name cue, cut at the first stop word; needs two tokens.
std::optional<std::string> extract_full_name(const std::string& text);

// Line-by-line variant for OCR text. Also stops at digits and "/" tokens,
// and a single retained token is enough.
std::optional<std::string> extract_name_from_ocr(const std::string& text);

// at least two capitalized tokens outside the stop-word set
bool looks_like_name(const std::string& text);

// Spreadsheet exports sometimes carry the name as a column header
// ('Student Name' | 'Ahmad Daniel Bin Hassan' | ...).
std::optional<std::string> extract_name_from_columns(const std::vector<std::string>& columns);

// "Male", "Female" or "Prefer Not To Say"
std::optional<std::string> extract_gender(const std::string& text);

// "State Selangor" -> "Selangor"; "State negeri" -> "Negeri Sembilan"
std::optional<std::string> extract_state(const std::string& text);

struct InlineMetadata {
    std::vector<std::pair<std::string, std::string>> fields;  // "Student Name", "Gender", ...
    std::string remainder;                                     // line with the fields cut out
};

// Pulls Student Name, Gender, Nationality, School Level, Form and State out of
// a mixed line such as "Name Arif Bin Hassan Languages 74/100".
InlineMetadata parse_metadata_line(const std::string& line);

// Recipient of a certificate ("This certificate is presented to\nHelene Paquet").
std::optional<std::string> extract_certificate_name(const std::string& text);

struct MetadataConfig {
    size_t name_scan_lines = 20;
};

// Sources in priority order: column headers (name only), loader metadata,
// Student Details records, then the first lines of the text. The first value
// found for a field is kept.
StudentMetadata extract_student_metadata(const SourceTable& source,
                                         const CanonicalTable& table,
                                         const std::string& text,
                                         const MetadataConfig& cfg = {});

}  // namespace report
