#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace report {

struct ValidationError {
    std::string code;
    std::string message;
    std::string field;
};

struct ValidationReport {
    bool pass = true;
    std::vector<ValidationError> errors;
};

// Checks an emitted bundle: required fields and their types, canonical
// ratings, ranking order, strength/weakness consistency.
ValidationReport validate_bundle(const nlohmann::json& bundle);

// A missing or unparsable file is reported as an error, not thrown.
ValidationReport validate_bundle_file(const std::filesystem::path& path);

void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace report
