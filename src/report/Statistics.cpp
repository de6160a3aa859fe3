#include "report/Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace report {

static std::vector<double> present(const NumericColumn& c) {
    std::vector<double> v;
    v.reserve(c.values.size());
    for (const auto& x : c.values) {
        if (x) v.push_back(*x);
    }
    return v;
}

static double mean_of(const std::vector<double>& v) {
    double sum = 0.0;
    for (double x : v) sum += x;
    return sum / static_cast<double>(v.size());
}

static double median_of(std::vector<double> v) {
    std::sort(v.begin(), v.end());
    const size_t n = v.size();
    if (n % 2 == 1) return v[n / 2];
    return (v[n / 2 - 1] + v[n / 2]) / 2.0;
}

static double pstdev_of(const std::vector<double>& v) {
    const double m = mean_of(v);
    double acc = 0.0;
    for (double x : v) acc += (x - m) * (x - m);
    return std::sqrt(acc / static_cast<double>(v.size()));
}

std::map<std::string, std::string> detect_trends(const std::vector<NumericColumn>& columns) {
    std::map<std::string, std::string> trends;
    for (const auto& c : columns) {
        const auto v = present(c);
        if (v.size() < 2) continue;

        if (v.back() > v.front()) trends[c.name] = "increasing";
        else if (v.back() < v.front()) trends[c.name] = "decreasing";
        else trends[c.name] = "stable";
    }
    return trends;
}

std::map<std::string, std::string> generate_predictive_insights(const std::vector<NumericColumn>& columns) {
    std::map<std::string, std::string> insights;
    for (const auto& c : columns) {
        const auto v = present(c);
        if (v.size() < 3) continue;

        const double recent = mean_of(std::vector<double>(v.end() - 3, v.end()));
        const double overall = mean_of(v);

        if (recent > overall) insights[c.name] = "Recent performance is above average.";
        else if (recent < overall) insights[c.name] = "Recent performance is below average.";
        else insights[c.name] = "Performance is consistent.";
    }
    return insights;
}

StatisticsBundle compute_statistics(const std::vector<NumericColumn>& columns, int row_count, int column_count) {
    StatisticsBundle s;
    s.row_count = row_count;
    s.column_count = column_count;

    try {
        for (const auto& c : columns) {
            s.numeric_columns.push_back(c.name);

            const auto v = present(c);
            s.counts[c.name] = static_cast<int>(v.size());
            if (v.empty()) continue;

            s.averages[c.name] = mean_of(v);
            s.medians[c.name] = median_of(v);
            s.std_dev[c.name] = pstdev_of(v);
        }

        s.trends = detect_trends(columns);
        s.predictive_insights = generate_predictive_insights(columns);
    } catch (const std::exception& e) {
        std::cerr << "[warn] statistics failed: " << e.what() << "\n";
    }
    return s;
}

StatisticsBundle compute_statistics(const CanonicalTable& table) {
    NumericColumn score{"Score", {}};
    NumericColumn maximum{"Maximum", {}};
    score.values.reserve(table.size());
    maximum.values.reserve(table.size());

    for (const auto& r : table) {
        score.values.push_back(r.score);
        maximum.values.push_back(r.maximum);
    }

    return compute_statistics({score, maximum}, static_cast<int>(table.size()), 6);
}

}  // namespace report
