#include "report/BehaviourExtractor.hpp"

#include "report/Vocabulary.hpp"
#include "text/TextUtil.hpp"

#include <cctype>
#include <iostream>
#include <regex>

namespace report {

// ---------- rating normalization ----------

static std::string repair_ocr_chars(const std::string& t) {
    std::string out;
    out.reserve(t.size());
    for (char c : t) {
        switch (c) {
            case '0': out.push_back('o'); break;
            case '1': out.push_back('l'); break;
            case '5': out.push_back('s'); break;
            case '@': out.push_back('a'); break;
            case '4': out.push_back('a'); break;
            case '$': out.push_back('s'); break;
            default: out.push_back(c);
        }
    }
    return out;
}

static std::optional<std::string> exact_or_variant(const std::string& t) {
    for (const auto& r : canonical_ratings()) {
        if (t == textutil::to_lower(r)) return r;
    }
    const auto& variants = rating_variants();
    auto it = variants.find(t);
    if (it != variants.end()) return it->second;
    return std::nullopt;
}

// tiers 1-3; containment is left out
static std::optional<std::string> lookup_rating(const std::string& token) {
    const std::string t = textutil::to_lower(textutil::collapse_spaces(token));
    if (t.empty()) return std::nullopt;

    if (auto r = exact_or_variant(t)) return r;
    return exact_or_variant(repair_ocr_chars(t));
}

std::optional<std::string> normalize_rating(const std::string& token) {
    if (auto r = lookup_rating(token)) return r;

    const std::string fixed = repair_ocr_chars(textutil::to_lower(textutil::collapse_spaces(token)));
    if (fixed.empty()) return std::nullopt;
    for (const auto& r : canonical_ratings()) {
        if (fixed.find(textutil::to_lower(r)) != std::string::npos) return r;
    }
    return std::nullopt;
}

std::string clean_attribute(const std::string& attr) {
    std::string cleaned;
    cleaned.reserve(attr.size());
    for (unsigned char c : attr) {
        bool keep = std::isalnum(c) || std::isspace(c) || c == '_' || c == '-' || c == '/' || c == '&' || c == '\'';
        cleaned.push_back(keep ? static_cast<char>(c) : ' ');
    }
    std::string spaced;
    for (unsigned char c : cleaned) spaced.push_back(std::isspace(c) ? ' ' : static_cast<char>(c));
    return textutil::title_case(textutil::collapse_spaces(spaced));
}

std::optional<std::pair<std::string, std::string>> split_trailing_rating(const std::string& line) {
    const auto toks = textutil::split_ws(line);
    if (toks.size() < 2) return std::nullopt;

    // two-word ratings first ("Very Good")
    if (toks.size() >= 3) {
        const std::string two = toks[toks.size() - 2] + " " + toks.back();
        if (lookup_rating(two)) {
            std::vector<std::string> head(toks.begin(), toks.end() - 2);
            return std::make_pair(textutil::join(head, " "), two);
        }
    }
    if (lookup_rating(toks.back())) {
        std::vector<std::string> head(toks.begin(), toks.end() - 1);
        return std::make_pair(textutil::join(head, " "), toks.back());
    }
    return std::nullopt;
}

// ---------- patterns ----------

static std::string regex_escape(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : s) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

static const std::string& rating_alternation() {
    static const std::string alt = [] {
        std::string a;
        for (const auto& tok : rating_tokens()) {
            if (!a.empty()) a += "|";
            a += regex_escape(tok);
        }
        return a;
    }();
    return alt;
}

// 1-5 word attribute, optional ":"/"-" separator, then a rating token; the
// whole match stays on one line. The attribute is lazy so "Very" in
// "Teamwork Very Good" goes to the rating.
static const std::regex& strict_pattern() {
    static const std::regex re(
        R"(((?:[A-Za-z][A-Za-z'&\-/]{0,20})(?:[ \t]+[A-Za-z][A-Za-z'&\-/]{0,20}){0,4}?))"
        R"([ \t]*(?:[:\-][ \t]*|[ \t]+))"
        R"(\b()" + rating_alternation() + R"()\b)",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

static const std::regex& rating_token_pattern() {
    static const std::regex re(R"(\b(?:)" + rating_alternation() + R"()\b)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

static const std::regex& word_pattern() {
    static const std::regex re(R"([A-Za-z'&\-/]{1,30})");
    return re;
}

// ---------- extraction ----------

static BehaviourTraitMap final_filter(const BehaviourTraitMap& in, const BehaviourConfig& cfg) {
    BehaviourTraitMap out;
    for (const auto& kv : in.items) {
        if (kv.first.empty()) continue;
        if (textutil::has_digit(kv.first)) continue;
        if (kv.first.size() > cfg.max_attribute_length) continue;
        out.set(kv.first, kv.second);
    }
    return out;
}

static bool contains_ci(const std::string& haystack, const std::string& needle) {
    return textutil::to_lower(haystack).find(needle) != std::string::npos;
}

BehaviourTraitMap extract_behaviour_from_records(const CanonicalTable& table, const BehaviourConfig& cfg) {
    BehaviourTraitMap out;
    try {
        for (const auto& r : table) {
            if (!contains_ci(r.section, "behaviour") && !contains_ci(r.section, "behavior")) continue;
            if (!r.value) continue;

            const std::string label = textutil::trim(r.label);
            const std::string value = textutil::trim(*r.value);
            if (label.empty() || value.empty() || textutil::to_lower(value) == "nan") continue;

            auto rating = normalize_rating(value);
            if (!rating) continue;

            const std::string attr = clean_attribute(label);
            if (!attr.empty()) out.set(attr, *rating);
        }
    } catch (const std::exception& e) {
        std::cerr << "[warn] behaviour extraction from records failed: " << e.what() << "\n";
        return {};
    }
    return final_filter(out, cfg);
}

// table OCR puts behaviour on the left of '|'
static std::string preclean_text(const std::string& text) {
    std::string normalized = text;
    for (char& c : normalized) {
        if (c == '\r') c = '\n';
    }

    std::vector<std::string> lines;
    for (const auto& line : textutil::split_lines(normalized)) {
        const std::string t = textutil::trim(line);
        if (t.empty()) continue;
        const size_t bar = t.find('|');
        lines.push_back(bar == std::string::npos ? t : textutil::trim(t.substr(0, bar)));
    }
    return textutil::join(lines, "\n");
}

struct WordSpan {
    std::string text;
    size_t start = 0;
    size_t end = 0;
};

static BehaviourTraitMap fallback_pairs(const std::string& text, const BehaviourConfig& cfg) {
    BehaviourTraitMap results;

    std::vector<WordSpan> words;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), word_pattern()); it != std::sregex_iterator(); ++it) {
        WordSpan w;
        w.text = it->str();
        w.start = static_cast<size_t>(it->position());
        w.end = w.start + w.text.size();
        words.push_back(std::move(w));
    }

    for (auto it = std::sregex_iterator(text.begin(), text.end(), rating_token_pattern()); it != std::sregex_iterator(); ++it) {
        auto rating = normalize_rating(it->str());
        if (!rating) continue;

        const size_t rating_start = static_cast<size_t>(it->position());

        // last word ending before the rating
        int idx = -1;
        for (size_t i = 0; i < words.size(); ++i) {
            if (words[i].end <= rating_start) idx = static_cast<int>(i);
            else break;
        }
        if (idx < 0) continue;

        std::vector<std::string> attr_tokens;
        for (int i = idx; i >= 0 && attr_tokens.size() < cfg.max_fallback_words; --i) {
            const std::string& tok = words[static_cast<size_t>(i)].text;
            if (textutil::has_digit(tok) || tok.find('/') != std::string::npos) continue;
            if (tok.size() == 1 && !std::isalpha(static_cast<unsigned char>(tok[0]))) continue;
            attr_tokens.insert(attr_tokens.begin(), tok);
        }
        if (attr_tokens.empty()) continue;

        const std::string attr = clean_attribute(textutil::join(attr_tokens, " "));
        if (!attr.empty()) results.set(attr, *rating);
    }
    return results;
}

BehaviourTraitMap extract_behaviour_from_text(const std::string& text, const BehaviourConfig& cfg) {
    if (textutil::trim(text).empty()) return {};

    try {
        const std::string cleaned = preclean_text(text);

        BehaviourTraitMap results;
        for (auto it = std::sregex_iterator(cleaned.begin(), cleaned.end(), strict_pattern()); it != std::sregex_iterator(); ++it) {
            const auto& m = *it;
            auto rating = normalize_rating(m[2].str());
            if (!rating) continue;
            const std::string attr = clean_attribute(m[1].str());
            if (!attr.empty()) results.set(attr, *rating);
        }

        if (results.empty()) results = fallback_pairs(cleaned, cfg);

        return final_filter(results, cfg);
    } catch (const std::exception& e) {
        std::cerr << "[warn] behaviour extraction from text failed: " << e.what() << "\n";
        return {};
    }
}

BehaviourTraitMap extract_behaviour(const CanonicalTable& table, const std::string& text, const BehaviourConfig& cfg) {
    BehaviourTraitMap out = extract_behaviour_from_records(table, cfg);
    if (out.empty() && !text.empty()) out = extract_behaviour_from_text(text, cfg);
    return out;
}

std::map<std::string, std::vector<std::string>> group_traits_by_rating(const BehaviourTraitMap& traits) {
    std::map<std::string, std::vector<std::string>> grouped;
    for (const auto& kv : traits.items) grouped[kv.second].push_back(kv.first);
    return grouped;
}

}  // namespace report
