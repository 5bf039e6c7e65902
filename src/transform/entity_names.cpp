/**
 * @file entity_names.cpp
 * @brief Entity name normalization and validation heuristics
 */

#include <transform/entity_names.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <regex>

namespace NewsCube {

namespace {

bool is_suffix_trail(char c) {
    return is_space_byte(c) || c == '.' || c == ',' || c == ';' || c == ':';
}

bool is_folded_punct(char c) {
    return is_space_byte(c) || c == '-' || c == '.' || c == ',' || c == ';' || c == ':' ||
           c == '+' || c == '\'' || c == '"';
}

bool is_lower_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

// Remove `\s+<suffix>[\s.,;:]*$` if present
void strip_suffix(std::string& s, const std::string& suffix) {
    size_t end = s.size();
    while (end > 0 && is_suffix_trail(s[end - 1])) --end;

    if (end < suffix.size() + 1) return;
    size_t start = end - suffix.size();
    if (s.compare(start, suffix.size(), suffix) != 0) return;
    if (!is_space_byte(s[start - 1])) return;

    size_t cut = start;
    while (cut > 0 && is_space_byte(s[cut - 1])) --cut;
    s.erase(cut);
}

} // namespace

const std::vector<std::string>& company_suffixes() {
    static const std::vector<std::string> suffixes = [] {
        std::vector<std::string> v = {
            "inc", "incorporated", "corp", "corporation", "ltd", "limited",
            "llc", "llp", "co", "company", "group", "holdings", "labs", "laboratories",
            "therapeutics", "pharma", "biotech", "biosciences", "biopharmaceuticals",
            "pharmaceuticals", "biotechnology", "technologies", "solutions",
            "systems", "international", "global", "ag", "sa", "nv", "plc",
            "gmbh", "kk", "ltda", "srl", "spa", "sas"};
        std::sort(v.begin(), v.end(), [](const std::string& a, const std::string& b) {
            if (a.size() != b.size()) return a.size() > b.size();
            return a < b;
        });
        return v;
    }();
    return suffixes;
}

const std::vector<std::string>& entity_filter_words() {
    static const std::vector<std::string> words = {
        "alzheimer", "oncology", "neurology", "immunology", "hematology",
        "diabetes", "cancer", "therapeutic", "drug", "treatment", "therapy",
        "patient", "clinical", "trial", "approval", "fda", "ema", "regulatory",
        "disease", "disorder", "syndrome", "condition", "biomarker"};
    return words;
}

std::string normalize_entity_name(std::string_view name) {
    static const std::regex ampersand(R"(\s*&\s*)");
    static const std::regex conjunction(R"(\s+and\s+)");

    std::string s = to_lower(trim(name));
    if (s.empty()) return s;

    s = std::regex_replace(s, ampersand, " and ");
    s = std::regex_replace(s, conjunction, "and");

    for (const auto& suffix : company_suffixes()) {
        strip_suffix(s, suffix);
    }

    std::string folded;
    folded.reserve(s.size());
    for (char c : s) {
        if (!is_folded_punct(c)) folded.push_back(c);
    }

    size_t begin = 0;
    size_t end = folded.size();
    while (begin < end && !is_lower_alnum(folded[begin])) ++begin;
    while (end > begin && !is_lower_alnum(folded[end - 1])) --end;
    return folded.substr(begin, end - begin);
}

bool contains_filter_word(std::string_view lower_text) {
    for (const auto& word : entity_filter_words()) {
        if (contains(lower_text, word)) return true;
    }
    return false;
}

bool is_likely_company_name(std::string_view text, const std::vector<std::string>& known_companies) {
    std::string trimmed = trim(text);
    std::string lower = to_lower(trimmed);

    if (lower.size() < 2 || lower.size() > 50) return false;
    if (contains_filter_word(lower)) return false;

    for (const auto& known : known_companies) {
        if (!known.empty() && contains(lower, known)) return true;
    }

    for (const auto& suffix : company_suffixes()) {
        if (ends_with(lower, suffix) || contains(lower, " " + suffix)) return true;
    }

    std::vector<std::string> words = split_whitespace(trimmed);

    // Ticker or abbreviation
    if (words.size() == 1 && is_ascii_upper(trimmed[0]) && trimmed.size() <= 5) return true;

    // Proper-noun phrase
    if (words.size() >= 2 && words.size() <= 5 && is_ascii_upper(words[0][0])) return true;

    return false;
}

std::string classify_entity_type(std::string_view name) {
    static const char* const org_patterns[] = {
        "fda", "ema", "who", "nih", "university", "college", "institute", "hospital"};

    std::string lower = to_lower(name);
    for (const char* p : org_patterns) {
        if (contains(lower, p)) return "Organization";
    }
    return "Company";
}

std::string entity_core_word(std::string_view name) {
    static const std::string_view strip_chars = "'\".,;: ";

    std::string lower = rtrim_chars(to_lower(trim(name)), strip_chars);
    std::vector<std::string> words = split_whitespace(lower);
    if (words.empty()) return {};

    std::string core = rtrim_chars(words.front(), strip_chars);
    size_t begin = 0;
    while (begin < core.size() && strip_chars.find(core[begin]) != std::string_view::npos) ++begin;
    return core.substr(begin);
}

bool is_better_candidate(const EntityCandidate& a, const EntityCandidate& b) {
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    if (a.name.size() != b.name.size()) return a.name.size() > b.name.size();
    if (a.name != b.name) return a.name < b.name;
    return a.type < b.type;
}

} // namespace NewsCube
