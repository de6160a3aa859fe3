#pragma once
#include <ostream>
#include <string>

#include "report/AnalyzerConfig.hpp"
#include "report/Models.hpp"

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
int get_arg_int(int argc, char** argv, const std::string& key, int def);

// --config file first, then --topn / --no_lookahead / --ocr_report / --certificate
report::AnalyzerConfig config_from_args(int argc, char** argv);

// "text" or "table"; an explicit --format wins over the file extension
std::string detect_format(const std::string& path, const std::string& format_arg);

// KEY: value summary of one analyzed document
void print_bundle_summary(std::ostream& os, const report::ReportBundle& b);
