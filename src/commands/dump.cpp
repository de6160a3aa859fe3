#include "commands/dump.hpp"

#include "commands/common.hpp"
#include "io/JsonIO.hpp"
#include "report/RecordBuilder.hpp"
#include "report/OcrReportParser.hpp"

#include <iostream>
#include <string>

static int dump_usage() {
    std::cerr
        << "usage:\n"
        << "  report-agent dump --input <path> [--format text|table] [--no_lookahead] [--ocr_report]\n";
    return 1;
}

static void printRecord(const report::CanonicalRecord& r) {
    std::cout << "[" << r.section << "] " << r.label;
    if (r.score) {
        std::cout << "  " << report::format_number(*r.score);
        if (r.maximum) std::cout << "/" << report::format_number(*r.maximum);
    }
    if (r.value) std::cout << "  = " << *r.value;
    if (r.notes) std::cout << "  (" << *r.notes << ")";
    std::cout << "\n";
}

int cmd_dump(int argc, char** argv) {
    try {
        const std::string input = get_arg(argc, argv, "--input", "");
        if (input.empty()) {
            std::cerr << "error: missing --input\n";
            return dump_usage();
        }

        const std::string format = detect_format(input, get_arg(argc, argv, "--format", ""));
        const report::AnalyzerConfig cfg = config_from_args(argc, argv);

        report::CanonicalTable table;
        if (format == "table") {
            const report::SourceTable source = loadSourceTable(input);
            std::cout << "COLUMNS:";
            for (const auto& c : source.columns) std::cout << " [" << c << "]";
            std::cout << "\n";
            for (const auto& kv : source.metadata) std::cout << "META: " << kv.first << " = " << kv.second << "\n";
            table = report::normalize_table(source, cfg.classifier());
        } else {
            const std::string text = readTextFile(input);
            table = cfg.text_strategy == "ocr_report" ? report::parse_ocr_report(text)
                                                      : report::normalize_text(text, cfg.classifier());
        }

        for (const auto& r : table) printRecord(r);
        std::cout << "RECORDS: " << table.size() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "dump failed: " << e.what() << "\n";
        return 1;
    }
}
