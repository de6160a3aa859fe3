#include "io/JsonIO.hpp"

#include "text/TextUtil.hpp"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
using report::Cell;
using report::SourceTable;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static Cell toCell(const json& v) {
    if (v.is_null()) return std::nullopt;
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    if (v.is_number_unsigned()) return std::to_string(v.get<unsigned long long>());
    return v.dump();  // floats and booleans keep their JSON spelling
}

static std::vector<Cell> parseArrayRow(const json& row, const std::string& where) {
    require_array(row, where);
    std::vector<Cell> out;
    out.reserve(row.size());
    for (const auto& v : row) out.push_back(toCell(v));
    return out;
}

static std::string columnName(const Cell& c, size_t idx) {
    const std::string name = c ? textutil::trim(*c) : std::string();
    if (name.empty()) return "Unnamed: " + std::to_string(idx);
    return name;
}

static std::string rowText(const std::vector<Cell>& row) {
    std::vector<std::string> parts;
    for (const auto& c : row) {
        if (c && !textutil::trim(*c).empty()) parts.push_back(textutil::trim(*c));
    }
    return textutil::to_lower(textutil::join(parts, " "));
}

static bool containsAny(const std::string& s, std::initializer_list<const char*> words) {
    for (const char* w : words) {
        if (s.find(w) != std::string::npos) return true;
    }
    return false;
}

// a row naming both a data column and a numeric companion column
static int findHeaderRow(const std::vector<std::vector<Cell>>& rows) {
    const size_t limit = std::min<size_t>(15, rows.size());
    for (size_t i = 0; i < limit; ++i) {
        const std::string text = rowText(rows[i]);
        if (containsAny(text, {"label", "score", "subject", "mark", "grade", "result"}) &&
            containsAny(text, {"maximum", "total", "percentage", "notes"})) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

// "Student Name: | Ahmad Daniel" rows above the table
static void collectPreamble(const std::vector<std::vector<Cell>>& rows, size_t end, SourceTable& t) {
    for (size_t i = 0; i < end; ++i) {
        const auto& row = rows[i];
        if (row.size() < 2 || !row[0] || !row[1]) continue;

        std::string label = textutil::trim(*row[0]);
        while (!label.empty() && label.back() == ':') label.pop_back();
        const std::string value = textutil::trim(*row[1]);

        if (label.empty() || value.empty() || textutil::to_lower(value) == "nan" || value == label) continue;
        t.metadata.emplace_back(label, value);
    }
}

static void parseHeaderless(const json& rows, const std::string& where, SourceTable& t) {
    std::vector<std::vector<Cell>> raw;
    raw.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        raw.push_back(parseArrayRow(rows.at(i), where + ".rows[" + std::to_string(i) + "]"));
    }
    if (raw.empty()) return;

    const int found = findHeaderRow(raw);
    const size_t header = found >= 0 ? static_cast<size_t>(found) : 0;
    if (found > 0) collectPreamble(raw, header, t);

    for (size_t c = 0; c < raw[header].size(); ++c) t.columns.push_back(columnName(raw[header][c], c));
    for (size_t i = header + 1; i < raw.size(); ++i) t.rows.push_back(std::move(raw[i]));
}

static void parseObjectRows(const json& rows, const std::string& where, SourceTable& t) {
    const bool fixedColumns = !t.columns.empty();

    if (!fixedColumns) {
        for (const auto& row : rows) {
            if (!row.is_object()) continue;
            for (auto it = row.begin(); it != row.end(); ++it) {
                if (!t.has_column(it.key())) t.columns.push_back(it.key());
            }
        }
    }

    for (size_t i = 0; i < rows.size(); ++i) {
        const json& row = rows.at(i);
        require_object(row, where + ".rows[" + std::to_string(i) + "]");

        std::vector<Cell> cells;
        cells.reserve(t.columns.size());
        for (const auto& col : t.columns) {
            cells.push_back(row.contains(col) ? toCell(row.at(col)) : std::nullopt);
        }
        t.rows.push_back(std::move(cells));
    }
}

SourceTable parseSourceTable(const json& j, const std::string& where) {
    require_object(j, where);

    SourceTable t;
    if (!j.contains("rows")) {
        throw std::runtime_error(where + " missing required field: rows");
    }
    const json& rows = j.at("rows");
    require_array(rows, where + ".rows");

    if (j.contains("columns")) {
        const json& cols = j.at("columns");
        require_array(cols, where + ".columns");
        for (size_t i = 0; i < cols.size(); ++i) t.columns.push_back(columnName(toCell(cols.at(i)), i));
    }

    const bool objectRows = !rows.empty() && rows.at(0).is_object();

    if (objectRows) {
        parseObjectRows(rows, where, t);
    } else if (t.columns.empty()) {
        parseHeaderless(rows, where, t);
    } else {
        for (size_t i = 0; i < rows.size(); ++i) {
            t.rows.push_back(parseArrayRow(rows.at(i), where + ".rows[" + std::to_string(i) + "]"));
        }
    }

    if (j.contains("metadata")) {
        const json& md = j.at("metadata");
        require_object(md, where + ".metadata");
        for (auto it = md.begin(); it != md.end(); ++it) {
            const Cell v = toCell(it.value());
            if (v) t.metadata.emplace_back(it.key(), *v);
        }
    }

    return t;
}

json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON in " + path + ": " + e.what());
    }
    return j;
}

SourceTable loadSourceTable(const std::string& path) {
    return parseSourceTable(readJsonFile(path), "root");
}

std::string readTextFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open text file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}
