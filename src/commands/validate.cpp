#include "commands/validate.hpp"

#include "commands/common.hpp"
#include "report/BundleValidator.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  report-agent validate --bundle <path> [--out <path>]\n";
    return 1;
}

int cmd_validate(int argc, char** argv) {
    const std::string bundle_path = get_arg(argc, argv, "--bundle", "");
    if (bundle_path.empty()) {
        std::cerr << "error: missing --bundle\n";
        return validate_usage();
    }
    const std::string out_path = get_arg(argc, argv, "--out", "out/validation_report.json");

    try {
        const report::ValidationReport rep = report::validate_bundle_file(fs::path(bundle_path));
        report::write_validation_report(fs::path(out_path), rep);

        if (!rep.pass) {
            std::cerr << "validation failed: wrote " << out_path << "\n";
            for (const auto& e : rep.errors) {
                std::cerr << "- " << e.code << ": " << e.message;
                if (!e.field.empty()) std::cerr << " (field=" << e.field << ")";
                std::cerr << "\n";
            }
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "validate failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "VALIDATION: pass\n";
    std::cout << "OUT_VALIDATE: " << out_path << "\n";
    return 0;
}
