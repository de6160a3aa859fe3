#include "report/EntityExtractor.hpp"

#include "report/RecordBuilder.hpp"
#include "report/Vocabulary.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>

namespace report {

static std::vector<std::string> capitalized_tokens(const std::string& text) {
    static const std::regex re(R"([A-Z][a-zA-Z]+)");
    std::vector<std::string> out;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it) {
        out.push_back(it->str());
    }
    return out;
}

static std::string erase_match(const std::string& s, const std::smatch& m) {
    std::string out = s.substr(0, static_cast<size_t>(m.position(0)));
    out += s.substr(static_cast<size_t>(m.position(0) + m.length(0)));
    return textutil::collapse_spaces(out);
}

// ---------- names ----------

std::optional<std::string> extract_full_name(const std::string& text) {
    if (textutil::trim(text).empty()) return std::nullopt;

    try {
        static const std::regex cue(R"(\b(Student\s+Name|Name)\s*[:\-]?\s*(.+))", std::regex::ECMAScript | std::regex::icase);

        const std::string flat = textutil::collapse_spaces(textutil::join(textutil::split_ws(text), " "));
        std::smatch m;
        const std::string remainder = std::regex_search(flat, m, cue) ? m[2].str() : flat;

        const auto tokens = capitalized_tokens(remainder);
        if (tokens.size() < 2) return std::nullopt;

        std::vector<std::string> parts;
        for (const auto& t : tokens) {
            if (is_stop_word(t)) break;
            parts.push_back(t);
        }
        if (parts.size() < 2) return std::nullopt;
        return textutil::join(parts, " ");
    } catch (const std::exception& e) {
        std::cerr << "[warn] name extraction failed: " << e.what() << "\n";
        return std::nullopt;
    }
}

static std::vector<std::string> cut_at_stop(const std::string& candidate) {
    std::vector<std::string> words;
    for (const auto& w : textutil::split_ws(candidate)) {
        if (is_stop_word(w)) break;
        if (std::isdigit(static_cast<unsigned char>(w[0])) || w.find('/') != std::string::npos) break;
        words.push_back(w);
    }
    return words;
}

static const std::regex& ocr_name_pattern() {
    static const std::regex re(R"(\bName[:\s]+([A-Z][a-zA-Z]+(?:[ \t]+[A-Z][a-zA-Z]+)*))");
    return re;
}

std::optional<std::string> extract_name_from_ocr(const std::string& text) {
    try {
        for (const auto& raw : textutil::split_lines(text)) {
            const std::string line = textutil::trim(raw);
            if (line.find("Name") == std::string::npos) continue;

            std::smatch m;
            if (!std::regex_search(line, m, ocr_name_pattern())) continue;

            const auto words = cut_at_stop(m[1].str());
            if (!words.empty()) return textutil::join(words, " ");
        }
    } catch (const std::exception& e) {
        std::cerr << "[warn] OCR name extraction failed: " << e.what() << "\n";
    }
    return std::nullopt;
}

bool looks_like_name(const std::string& text) {
    const auto tokens = capitalized_tokens(text);
    if (tokens.size() < 2) return false;
    const auto non_stop = std::count_if(tokens.begin(), tokens.end(),
                                        [](const std::string& t) { return !is_stop_word(t); });
    return non_stop >= 2;
}

std::optional<std::string> extract_name_from_columns(const std::vector<std::string>& columns) {
    static const std::regex name_label(R"(^(Student\s+)?Name$)", std::regex::ECMAScript | std::regex::icase);

    for (const auto& col : columns) {
        const std::string c = textutil::trim(col);
        if (c.empty() || textutil::starts_with(c, "Unnamed")) continue;
        if (std::regex_search(c, name_label)) continue;

        const auto tokens = capitalized_tokens(c);
        if (tokens.size() < 2) continue;

        std::vector<std::string> kept;
        for (const auto& t : tokens) {
            if (!is_stop_word(t)) kept.push_back(t);
        }
        if (kept.size() >= 2) return textutil::join(kept, " ");
    }
    return std::nullopt;
}

// ---------- gender / state ----------

std::optional<std::string> extract_gender(const std::string& text) {
    static const std::regex re(R"(\b(Male|Female|Prefer not to say)\b)", std::regex::ECMAScript | std::regex::icase);
    std::smatch m;
    if (!std::regex_search(text, m, re)) return std::nullopt;
    return textutil::title_case(m[1].str());
}

static std::string resolve_state(const std::string& first, const std::string& second) {
    if (textutil::to_lower(first) == "negeri") return "Negeri Sembilan";
    if (!second.empty()) {
        const std::string both = first + " " + second;
        const auto& states = malaysian_states();
        if (std::find(states.begin(), states.end(), both) != states.end()) return both;
    }
    return first;
}

std::optional<std::string> extract_state(const std::string& text) {
    // any-case cue, capitalized state words
    static const std::regex re(R"(\b[Ss][Tt][Aa][Tt][Ee]\b\s*[:\-]?\s*([A-Z][a-zA-Z]+)(?:[ \t]+([A-Z][a-zA-Z]+))?)");
    std::smatch m;
    if (!std::regex_search(text, m, re)) return std::nullopt;
    return resolve_state(m[1].str(), m[2].matched ? m[2].str() : std::string());
}

// ---------- inline metadata ----------

static void take_name(std::string& line, InlineMetadata& out) {
    if (line.find("Name") == std::string::npos) return;

    std::smatch m;
    if (!std::regex_search(line, m, ocr_name_pattern())) return;

    const auto words = cut_at_stop(m[1].str());
    if (words.empty()) return;

    out.fields.emplace_back("Student Name", textutil::join(words, " "));

    // cut "Name: <kept words>" and leave the rest of the line for score parsing
    std::string pat = R"(Name[:\s]+)" + textutil::join(words, R"(\s+)");
    std::smatch cut;
    if (std::regex_search(line, cut, std::regex(pat))) line = erase_match(line, cut);
}

static void take_simple(std::string& line, InlineMetadata& out, const char* key, const std::regex& re, bool title) {
    if (textutil::to_lower(line).find(textutil::to_lower(key)) == std::string::npos) return;
    std::smatch m;
    if (!std::regex_search(line, m, re)) return;
    const std::string v = title ? textutil::title_case(m[1].str()) : m[1].str();
    out.fields.emplace_back(key, v);
    line = erase_match(line, m);
}

static void take_school_level(std::string& line, InlineMetadata& out) {
    const size_t pos = line.find("School Level");
    if (pos == std::string::npos) return;

    static const std::regex re(R"(School Level[:\s]+(.+))");
    std::smatch m;
    if (!std::regex_search(line, m, re)) return;

    std::string value = textutil::trim(m[1].str());
    // stop at the next field cue
    static const std::regex next_cue(R"(\s+(Form|State|Gender|Nationality)[:\s])");
    std::smatch n;
    if (std::regex_search(value, n, next_cue)) value = textutil::trim(value.substr(0, static_cast<size_t>(n.position(0))));
    if (value.empty()) return;

    out.fields.emplace_back("School Level", value);

    const std::string head = line.substr(0, pos);
    const size_t value_pos = line.find(value, pos);
    const std::string tail = (value_pos == std::string::npos) ? std::string() : line.substr(value_pos + value.size());
    line = textutil::collapse_spaces(head + " " + tail);
}

static void take_form(std::string& line, InlineMetadata& out) {
    if (line.find("Form") == std::string::npos || line.find("School") != std::string::npos) return;

    static const std::regex re(R"(Form[:\s]+(Form\s+)?([0-9]+))");
    std::smatch m;
    if (!std::regex_search(line, m, re)) return;
    out.fields.emplace_back("Form", "Form " + m[2].str());
    line = erase_match(line, m);
}

static void take_state(std::string& line, InlineMetadata& out) {
    if (line.find("State") == std::string::npos) return;

    static const std::regex re(R"(\bState[:\s]+([A-Z][a-z]+)(?:[ \t]+([A-Z][a-z]+))?)");
    std::smatch m;
    if (!std::regex_search(line, m, re)) return;

    const std::string first = m[1].str();
    const std::string second = m[2].matched ? m[2].str() : std::string();
    const std::string state = resolve_state(first, second);
    out.fields.emplace_back("State", state);

    // only the words that make up the state are consumed
    const bool two_words = !second.empty() && (state == first + " " + second);
    const size_t end = static_cast<size_t>(two_words ? m.position(0) + m.length(0) : m.position(1) + m.length(1));
    std::string rest = line.substr(0, static_cast<size_t>(m.position(0))) + " " + line.substr(end);
    if (state == "Negeri Sembilan" && !two_words) {
        static const std::regex sembilan(R"(^\s*Sembilan\b)");
        rest = line.substr(0, static_cast<size_t>(m.position(0))) + " " +
               std::regex_replace(line.substr(end), sembilan, "");
    }
    line = textutil::collapse_spaces(rest);
}

InlineMetadata parse_metadata_line(const std::string& raw) {
    InlineMetadata out;
    std::string line = textutil::collapse_spaces(raw);

    try {
        static const std::regex gender(R"(Gender[:\s]+(Male|Female))", std::regex::ECMAScript | std::regex::icase);
        static const std::regex nationality(R"(Nationality[:\s]+([A-Za-z]+))");

        take_name(line, out);
        take_simple(line, out, "Gender", gender, true);
        take_simple(line, out, "Nationality", nationality, false);
        take_school_level(line, out);
        take_form(line, out);
        take_state(line, out);
    } catch (const std::exception& e) {
        std::cerr << "[warn] metadata line parse failed: " << e.what() << "\n";
    }

    out.remainder = line;
    return out;
}

// ---------- certificates ----------

// "H e l e n e" -> "Helene"
static std::string collapse_spaced_letters(const std::string& text) {
    static const std::regex re(R"(\b(?:[A-Za-z] ){2,}[A-Za-z]\b)");
    std::string out;
    auto last = text.cbegin();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it) {
        out.append(last, text.cbegin() + it->position());
        std::string run = it->str();
        run.erase(std::remove(run.begin(), run.end(), ' '), run.end());
        out += run;
        last = text.cbegin() + it->position() + it->length();
    }
    out.append(last, text.cend());
    return out;
}

static std::string normalize_certificate_text(const std::string& text) {
    std::string t = textutil::join(textutil::split_lines(text), "\n");
    t = collapse_spaced_letters(t);

    static const std::regex spaces(R"([ \t]{2,})");
    static const std::regex newlines(R"(\n{2,})");
    t = std::regex_replace(t, spaces, " ");
    t = std::regex_replace(t, newlines, "\n\n");
    return textutil::trim(t);
}

static const std::vector<std::string>& certificate_phrases() {
    static const std::vector<std::string> phrases = {
        "this certifies that",
        "this certificate is proudly presented to",
        "presented to",
        "this to certify that",
        "this certificate is presented to",
        "this certificate of completion is presented to",
        "this certificate is awarded to",
    };
    return phrases;
}

// all-caps headings that are not names
static bool is_certificate_heading(const std::string& candidate) {
    static const std::vector<std::string> words = {
        "certificate", "completion", "achievement", "appreciation", "participation",
        "award", "presented", "this", "is", "of",
    };
    for (const auto& w : textutil::split_ws(candidate)) {
        if (std::find(words.begin(), words.end(), textutil::to_lower(w)) != words.end()) return true;
    }
    return false;
}

// "to" -> "[tT][oO]": the cue is matched in any case, the name is not
static std::string any_case(const std::string& phrase) {
    std::string out;
    for (unsigned char c : phrase) {
        if (std::isalpha(c)) {
            out += '[';
            out += static_cast<char>(std::tolower(c));
            out += static_cast<char>(std::toupper(c));
            out += ']';
        } else if (c == ' ') {
            out += R"(\s+)";
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

std::optional<std::string> extract_certificate_name(const std::string& text) {
    if (textutil::trim(text).empty()) return std::nullopt;

    try {
        const std::string t = normalize_certificate_text(text);
        const std::string name_run = R"(([A-Z][A-Za-z'`.\-]+(?:[ \t]+[A-Z][A-Za-z'`.\-]+){0,4}))";

        // phrase on its own line, name on the next
        for (const auto& phrase : certificate_phrases()) {
            const std::regex block(any_case(phrase) + R"([ \t]*(?:[:\-][ \t]*)?\n\s*)" + name_run + R"([ \t]*(?=\n|$|[.,;:!?]))");
            std::smatch m;
            if (std::regex_search(t, m, block)) return textutil::trim(m[1].str());
        }

        // inline, stopping before the verb that follows the name
        for (const auto& phrase : certificate_phrases()) {
            const std::regex inl(any_case(phrase) + R"([ \t]*(?:[:\-][ \t]*)?)" + name_run +
                                 R"((?=[ \t]*(?:has\b|was\b|completed\b|successfully\b|,|\n|$|\.)))");
            std::smatch m;
            if (std::regex_search(t, m, inl)) return textutil::trim(m[1].str());
        }

        static const std::regex all_caps(R"(\b([A-Z]{2,}(?:[ \t]+[A-Z]{2,}){0,4})\b)");
        for (auto it = std::sregex_iterator(t.begin(), t.end(), all_caps); it != std::sregex_iterator(); ++it) {
            const std::string candidate = textutil::trim(it->str(1));
            const auto words = textutil::split_ws(candidate);
            if (words.empty() || words.size() > 3 || candidate.size() >= 40) continue;
            if (is_certificate_heading(candidate)) continue;

            std::vector<std::string> parts;
            for (const auto& w : words) {
                parts.push_back(w.size() <= 2 ? w : textutil::title_case(w));  // keep initials
            }
            return textutil::join(parts, " ");
        }

        static const std::regex title_run(R"(\b([A-Z][a-z]+(?:[ \t]+[A-Z][a-z]+){1,2})\b)");
        std::smatch m;
        if (std::regex_search(t, m, title_run)) return textutil::trim(m[1].str());
    } catch (const std::exception& e) {
        std::cerr << "[warn] certificate name extraction failed: " << e.what() << "\n";
    }
    return std::nullopt;
}

// ---------- metadata assembly ----------

// an undisclosed gender also counts as the first match
static void set_gender(StudentMetadata& md, const std::string& g) {
    if (md.gender || md.field("Gender")) return;
    if (g == "Male") md.gender = Gender::Male;
    else if (g == "Female") md.gender = Gender::Female;
    else md.set_field("Gender", g);
}

static void apply_name(StudentMetadata& md, const std::optional<std::string>& name) {
    if (!md.name && name) md.name = *name;
}

static void apply_pair(StudentMetadata& md, const std::string& raw_key, const std::string& raw_value) {
    std::string key = textutil::trim(raw_key);
    while (!key.empty() && key.back() == ':') key.pop_back();
    key = textutil::trim(key);
    const std::string value = textutil::trim(raw_value);
    if (key.empty() || value.empty() || textutil::to_lower(value) == "nan" || value == key) return;

    const std::string lk = textutil::to_lower(key);

    if (lk.find("name") != std::string::npos) {
        if (!md.name) {
            auto n = extract_full_name(key + " " + value);
            if (!n && looks_like_name(value)) n = value;
            apply_name(md, n);
        }
        return;
    }
    if (lk == "gender") {
        if (auto g = extract_gender(value)) set_gender(md, *g);
        else md.set_field(key, value);
        return;
    }
    if (lk == "state") {
        if (!md.state) md.state = extract_state("State " + value).value_or(value);
        return;
    }
    md.set_field(key, value);
}

static void apply_inline(StudentMetadata& md, const InlineMetadata& im) {
    for (const auto& kv : im.fields) {
        if (kv.first == "Student Name") apply_name(md, kv.second);
        else if (kv.first == "Gender") set_gender(md, kv.second);
        else if (kv.first == "State") {
            if (!md.state) md.state = kv.second;
        } else {
            md.set_field(kv.first, kv.second);
        }
    }
}

static void scan_free_text(StudentMetadata& md, const std::string& text) {
    if (auto g = extract_gender(text)) set_gender(md, *g);
    if (!md.state) {
        if (auto s = extract_state(text)) md.state = *s;
    }
}

StudentMetadata extract_student_metadata(const SourceTable& source,
                                         const CanonicalTable& table,
                                         const std::string& text,
                                         const MetadataConfig& cfg) {
    StudentMetadata md;

    try {
        // column-header strategy outranks everything found by scanning rows
        apply_name(md, extract_name_from_columns(source.columns));

        for (const auto& kv : source.metadata) apply_pair(md, kv.first, kv.second);

        for (const auto& r : table) {
            if (r.section != kSectionStudent) continue;

            std::optional<std::string> value = r.value;
            if (!value && r.score) value = format_number(*r.score);

            if (value) {
                apply_pair(md, r.label, *value);
                scan_free_text(md, r.label + " " + *value);
                continue;
            }

            // classifier metadata line: the raw line is the label
            apply_inline(md, parse_metadata_line(r.label));
            if (textutil::to_lower(r.label).find("name") != std::string::npos) {
                apply_name(md, extract_full_name(r.label));
                apply_name(md, extract_name_from_ocr(r.label));
            }
            scan_free_text(md, r.label);
        }

        if (!text.empty()) {
            const auto lines = textutil::split_lines(text);
            const size_t n = std::min(lines.size(), cfg.name_scan_lines);
            const std::string head = textutil::join(std::vector<std::string>(lines.begin(), lines.begin() + n), "\n");

            apply_name(md, extract_name_from_ocr(head));
            for (size_t i = 0; i < n; ++i) {
                const std::string line = textutil::trim(lines[i]);
                if (line.empty()) continue;
                apply_inline(md, parse_metadata_line(line));
                scan_free_text(md, line);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[warn] metadata extraction failed: " << e.what() << "\n";
    }

    return md;
}

}  // namespace report
