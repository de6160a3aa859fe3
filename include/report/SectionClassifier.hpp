#pragma once
#include <optional>
#include <string>
#include <vector>

#include "report/Models.hpp"

namespace report {

// Canonical section when the line is a section header, else nothing.
// Tolerates letter-spaced OCR ("S u b j e c t s").
std::optional<std::string> detect_section_header(const std::string& line);

// Metadata key ("name", "gender", ...) when the line starts with one.
std::optional<std::string> detect_metadata_key(const std::string& line);

struct ClassifierConfig {
    bool lookahead = true;  // join a label line with a score on the next line
};

// Single forward pass over text lines. Headers move the section cursor and
// produce no record; every other non-empty line produces exactly one record
// (or two lines produce one, when the lookahead joins them).
class SectionClassifier {
public:
    explicit SectionClassifier(ClassifierConfig cfg = {});

    CanonicalTable classify(const std::vector<std::string>& lines);

    // cursor after the last classify() call
    const std::optional<std::string>& current_section() const { return m_section; }

private:
    std::string data_section() const;
    std::string fallback_section() const;

    ClassifierConfig m_cfg;
    std::optional<std::string> m_section;
};

}  // namespace report
