#pragma once
#include <string>

#include "report/Models.hpp"

namespace report {

// Layout-aware reading of a scanned report card. Handles lines that mix
// metadata with a score ("Name Arif Bin Hassan Languages 74/100"), parallel
// columns split by '|' (scores on one side, behaviour ratings on the other)
// and club/award lines. Produces Student Details rows with Label/Value pairs
// instead of raw metadata lines.
CanonicalTable parse_ocr_report(const std::string& text);

}  // namespace report
