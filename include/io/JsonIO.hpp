#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "report/Models.hpp"

// Table documents:
//   {"columns": [...], "rows": [[...], ...], "metadata": {...}}
//   {"columns": [...], "rows": [{"Label": ..., "Score": ...}, ...]}
//   {"rows": [[...], ...]}   header row detected within the first 15 rows
report::SourceTable parseSourceTable(const nlohmann::json& j, const std::string& where = "root");
report::SourceTable loadSourceTable(const std::string& path);

// whole file as text; throws when it cannot be opened
std::string readTextFile(const std::string& path);

nlohmann::json readJsonFile(const std::string& path);
