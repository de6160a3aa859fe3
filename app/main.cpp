#include "commands/analyze.hpp"
#include "commands/batch.hpp"
#include "commands/dump.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  report-agent analyze [args]\n"
        << "  report-agent batch [args]\n"
        << "  report-agent dump [args]\n"
        << "  report-agent validate [args]\n"
        << "  report-agent help\n";
    return 1;
}

static void print_config_options() {
    std::cerr
        << "config:\n"
        << "  --config <path>              JSON file with analyzer settings\n"
        << "  --topn <n>                   default: 5\n"
        << "  --no_lookahead               do not join a label line with a score on the next line\n"
        << "  --ocr_report                 layout-aware parsing for scanned report cards\n"
        << "  --certificate                fall back to the certificate recipient for the name\n";
}

static int print_analyze_help() {
    std::cerr
        << "usage:\n"
        << "  report-agent analyze --input <path> [options]\n"
        << "\n"
        << "common:\n"
        << "  --input <path>               (required) .txt text or .json table document\n"
        << "  --format <text|table>        default: by file extension\n"
        << "  --out <path>                 optional: write the JSON bundle\n"
        << "\n";
    print_config_options();
    return 0;
}

static int print_batch_help() {
    std::cerr
        << "usage:\n"
        << "  report-agent batch --dir <dir> [options]\n"
        << "\n"
        << "common:\n"
        << "  --dir <dir>                  (required) folder of .txt/.json documents\n"
        << "  --outdir <dir>               default: out\n"
        << "\n";
    print_config_options();
    return 0;
}

static int print_dump_help() {
    std::cerr
        << "usage:\n"
        << "  report-agent dump --input <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --format <text|table>        default: by file extension\n"
        << "  --no_lookahead\n"
        << "  --ocr_report\n";
    return 0;
}

static int print_validate_help() {
    std::cerr
        << "usage:\n"
        << "  report-agent validate --bundle <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --out <path>                 default: out/validation_report.json\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    const bool wants_help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "analyze"  && wants_help) return print_analyze_help();
    if (cmd == "batch"    && wants_help) return print_batch_help();
    if (cmd == "dump"     && wants_help) return print_dump_help();
    if (cmd == "validate" && wants_help) return print_validate_help();

    if (cmd == "analyze")  return cmd_analyze(argc - 1, argv + 1);
    if (cmd == "batch")    return cmd_batch(argc - 1, argv + 1);
    if (cmd == "dump")     return cmd_dump(argc - 1, argv + 1);
    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
