#pragma once
#include <string>
#include <vector>

#include "report/Models.hpp"

namespace report {

// "Bahasa Malaysia Paper 2" -> "Bahasa Malaysia"; "Marks for Physics" -> "Physics"
std::string simplify_ranking_label(const std::string& label);

// Every (label, score) pair found in the table: scored records first, then
// label/score patterns inside any cell. Sorted by score (descending, stable)
// and deduplicated by label so each keeps its highest score.
std::vector<RankingEntry> extract_ranking(const CanonicalTable& table);

// highest-first, one entry per label; at most n entries
std::vector<RankingEntry> top_scores(const CanonicalTable& table, size_t n = 5);

// stable descending sort followed by keep-first dedup; idempotent
std::vector<RankingEntry> dedup_ranking(std::vector<RankingEntry> entries);

}  // namespace report
