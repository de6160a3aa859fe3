#include "report/RecordBuilder.hpp"

#include "text/TextUtil.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

namespace report {

std::optional<double> coerce_number(const Cell& cell) {
    if (!cell) return std::nullopt;
    double v = 0.0;
    if (!textutil::parse_number(*cell, v) || v < 0.0) return std::nullopt;
    return v;
}

static bool is_blank(const Cell& c) {
    if (!c) return true;
    const std::string t = textutil::trim(*c);
    return t.empty() || textutil::to_lower(t) == "nan";
}

std::vector<std::string> table_to_lines(const SourceTable& table) {
    std::vector<std::string> lines;
    lines.reserve(table.rows.size());

    for (const auto& row : table.rows) {
        std::vector<std::string> vals;
        for (const auto& c : row) {
            if (!is_blank(c)) vals.push_back(textutil::trim(*c));
        }
        if (vals.empty()) continue;

        if (table.columns.size() == 1) {
            lines.push_back(vals.front());
        } else {
            lines.push_back(textutil::join(vals, " "));
        }
    }
    return lines;
}

static Cell cell_at(const std::vector<Cell>& row, int idx) {
    if (idx < 0 || static_cast<size_t>(idx) >= row.size()) return std::nullopt;
    return row[static_cast<size_t>(idx)];
}

static CanonicalTable pass_through(const SourceTable& table) {
    const int sec_i = table.column_index("Section");
    const int lab_i = table.column_index("Label");
    const int score_i = table.column_index("Score");
    const int max_i = table.column_index("Maximum");
    const int val_i = table.column_index("Value");
    const int notes_i = table.column_index("Notes");

    CanonicalTable out;
    out.reserve(table.rows.size());

    for (const auto& row : table.rows) {
        CanonicalRecord r;
        const Cell sec = cell_at(row, sec_i);
        const Cell lab = cell_at(row, lab_i);
        r.section = is_blank(sec) ? std::string() : textutil::trim(*sec);
        r.label = is_blank(lab) ? std::string() : textutil::trim(*lab);
        r.score = coerce_number(cell_at(row, score_i));
        r.maximum = coerce_number(cell_at(row, max_i));

        const Cell val = cell_at(row, val_i);
        if (!is_blank(val)) r.value = textutil::trim(*val);
        const Cell notes = cell_at(row, notes_i);
        if (!is_blank(notes)) r.notes = textutil::trim(*notes);

        out.push_back(std::move(r));
    }
    return out;
}

CanonicalTable normalize_table(const SourceTable& table, const ClassifierConfig& cfg) {
    try {
        if (table.has_column("Section") && table.has_column("Label")) {
            return pass_through(table);
        }
        return normalize_lines(table_to_lines(table), cfg);
    } catch (const std::exception& e) {
        std::cerr << "[warn] table normalization failed: " << e.what() << "\n";
        return {};
    }
}

CanonicalTable normalize_lines(const std::vector<std::string>& lines, const ClassifierConfig& cfg) {
    try {
        SectionClassifier classifier(cfg);
        return classifier.classify(lines);
    } catch (const std::exception& e) {
        std::cerr << "[warn] line normalization failed: " << e.what() << "\n";
        return {};
    }
}

CanonicalTable normalize_text(const std::string& text, const ClassifierConfig& cfg) {
    return normalize_lines(textutil::split_lines(text), cfg);
}

std::string format_number(double v) {
    if (std::floor(v) == v && std::fabs(v) < 1e15) {
        return std::to_string(static_cast<long long>(v));
    }
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

}  // namespace report
