#include "report/ReportAnalyzer.hpp"

#include "report/BehaviourExtractor.hpp"
#include "report/EntityExtractor.hpp"
#include "report/OcrReportParser.hpp"
#include "report/RankingExtractor.hpp"
#include "report/RecordBuilder.hpp"
#include "report/Statistics.hpp"
#include "report/SubjectResolver.hpp"
#include "text/TextUtil.hpp"

namespace report {

// everything downstream of the canonical table
static void extract_all(ReportBundle& b, const SourceTable& source, const std::string& text, const AnalyzerConfig& cfg) {
    b.metadata = extract_student_metadata(source, b.table, text, cfg.metadata());
    if (cfg.certificate_mode && !b.metadata.name) {
        b.metadata.name = extract_certificate_name(text);
    }

    b.subjects = resolve_subjects(b.table);
    b.activities = extract_activities(b.table);
    b.behaviour = extract_behaviour(b.table, text, cfg.behaviour());
    b.top_scores = top_scores(b.table, cfg.top_n);
    b.statistics = compute_statistics(b.table);
}

ReportBundle analyze_text(const std::string& text, const AnalyzerConfig& cfg) {
    ReportBundle b;
    if (cfg.text_strategy == "ocr_report") {
        b.table = parse_ocr_report(text);
    } else {
        b.table = normalize_text(text, cfg.classifier());
    }

    extract_all(b, SourceTable{}, text, cfg);
    return b;
}

ReportBundle analyze_table(const SourceTable& source, const AnalyzerConfig& cfg) {
    ReportBundle b;
    b.table = normalize_table(source, cfg.classifier());

    // behaviour and certificate fallbacks read the rows as text
    const std::string text = textutil::join(table_to_lines(source), "\n");
    extract_all(b, source, text, cfg);
    return b;
}

}  // namespace report
