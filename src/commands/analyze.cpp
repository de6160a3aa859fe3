#include "commands/analyze.hpp"

#include "commands/common.hpp"
#include "io/JsonIO.hpp"
#include "report/ReportAnalyzer.hpp"
#include "report/ReportArtifact.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int analyze_usage() {
    std::cerr
        << "usage:\n"
        << "  report-agent analyze --input <path> [options]\n";
    return 1;
}

int cmd_analyze(int argc, char** argv) {
    try {
        const std::string input = get_arg(argc, argv, "--input", "");
        if (input.empty()) {
            std::cerr << "error: missing --input\n";
            return analyze_usage();
        }

        const std::string format = detect_format(input, get_arg(argc, argv, "--format", ""));
        const std::string out_path = get_arg(argc, argv, "--out", "");
        const report::AnalyzerConfig cfg = config_from_args(argc, argv);

        report::ReportBundle bundle;
        if (format == "table") {
            bundle = report::analyze_table(loadSourceTable(input), cfg);
        } else {
            bundle = report::analyze_text(readTextFile(input), cfg);
        }

        std::cout << "INPUT: " << input << "\n";
        std::cout << "FORMAT: " << format << "\n";
        if (format == "text") std::cout << "STRATEGY: " << cfg.text_strategy << "\n";
        print_bundle_summary(std::cout, bundle);

        if (!out_path.empty()) {
            report::ReportArtifact artifact;
            artifact.source_path = input;
            artifact.source_format = format;
            artifact.config = cfg;
            artifact.bundle = std::move(bundle);
            artifact.write_to(fs::path(out_path));
            std::cout << "OUT_BUNDLE: " << out_path << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "analyze failed: " << e.what() << "\n";
        return 1;
    }
}
