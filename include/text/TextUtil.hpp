#pragma once
#include <string>
#include <vector>

namespace textutil {

// lowercase, keep letters/digits, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text into tokens, drop empty tokens
std::vector<std::string> tokenize(const std::string& normalized);

std::string trim(const std::string& s);
std::string to_lower(std::string s);

// collapse runs of spaces/tabs into a single space, then trim
std::string collapse_spaces(const std::string& s);

// drop every whitespace character ("S u b j e c t s" -> "Subjects")
std::string strip_spaces(const std::string& s);

// split on '\n', dropping '\r'; keeps empty lines
std::vector<std::string> split_lines(const std::string& s);

// split on runs of whitespace
std::vector<std::string> split_ws(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// "sejarah (history)" -> "Sejarah (History)"
std::string title_case(const std::string& s);

bool has_digit(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);

// word-bounded containment; both sides are run through normalize() first
bool contains_phrase(const std::string& haystack, const std::string& phrase);

// strict numeric parse: the whole (trimmed) string must be a number
bool parse_number(const std::string& s, double& out);

}
