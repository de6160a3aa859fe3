#pragma once
#include <string>

#include "report/AnalyzerConfig.hpp"
#include "report/Models.hpp"

namespace report {

// Full pipeline for one plain-text document (OCR output, extracted PDF text).
ReportBundle analyze_text(const std::string& text, const AnalyzerConfig& cfg = {});

// Full pipeline for one tabular document as handed over by the loader.
ReportBundle analyze_table(const SourceTable& source, const AnalyzerConfig& cfg = {});

}  // namespace report
