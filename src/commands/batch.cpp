#include "commands/batch.hpp"

#include "commands/common.hpp"
#include "io/DocumentCorpus.hpp"
#include "report/ReportAnalyzer.hpp"
#include "report/ReportArtifact.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int batch_usage() {
    std::cerr
        << "usage:\n"
        << "  report-agent batch --dir <dir> [--outdir <dir>] [--config <path>]\n";
    return 1;
}

int cmd_batch(int argc, char** argv) {
    try {
        const std::string dir = get_arg(argc, argv, "--dir", "");
        if (dir.empty()) {
            std::cerr << "error: missing --dir\n";
            return batch_usage();
        }
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");
        const report::AnalyzerConfig cfg = config_from_args(argc, argv);

        const DocumentCorpus corpus = DocumentCorpus::load_from_dir(dir);

        size_t empty_docs = 0;
        for (const auto& doc : corpus.documents()) {
            report::ReportArtifact artifact;
            artifact.source_path = doc.path;
            artifact.config = cfg;

            if (doc.kind == DocumentKind::Table) {
                artifact.source_format = "table";
                artifact.bundle = report::analyze_table(doc.table, cfg);
            } else {
                artifact.source_format = "text";
                artifact.bundle = report::analyze_text(doc.text, cfg);
            }

            const fs::path out_path = outdir / (doc.id + ".json");
            artifact.write_to(out_path);

            if (artifact.bundle.empty()) ++empty_docs;
            std::cout << "DOC: " << doc.id << " records=" << artifact.bundle.table.size()
                      << " -> " << out_path.string() << "\n";
        }

        std::cout << "DOCUMENTS: " << corpus.documents().size() << "\n";
        std::cout << "EMPTY: " << empty_docs << "\n";
        std::cout << "FAILED: " << corpus.failures().size() << "\n";
        std::cout << "OUTDIR: " << outdir.string() << "\n";

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "batch failed: " << e.what() << "\n";
        return 1;
    }
}
