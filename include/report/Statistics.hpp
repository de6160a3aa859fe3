#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "report/Models.hpp"

namespace report {

// A numeric column in row order; nulls are cells that failed coercion.
struct NumericColumn {
    std::string name;
    std::vector<std::optional<double>> values;
};

// first vs last non-null value; needs two values
std::map<std::string, std::string> detect_trends(const std::vector<NumericColumn>& columns);

// mean of the last three non-null values against the overall mean; needs three
std::map<std::string, std::string> generate_predictive_insights(const std::vector<NumericColumn>& columns);

// Mean, median, population std-dev and non-null count per column. A column
// without values reports count 0 and nothing else.
StatisticsBundle compute_statistics(const std::vector<NumericColumn>& columns, int row_count, int column_count);

// Score and Maximum of the canonical table (six columns wide).
StatisticsBundle compute_statistics(const CanonicalTable& table);

}  // namespace report
