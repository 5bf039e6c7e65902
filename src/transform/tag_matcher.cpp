/**
 * @file tag_matcher.cpp
 * @brief Tag matching implementation
 */

#include <transform/tag_matcher.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <unordered_set>

namespace NewsCube {

namespace {

constexpr size_t HEADLINE_MIN_TOKENS = 10;
constexpr size_t HEADLINE_TOKENS = 20;

const char* const kMedicalTerms[] = {"cancer", "therapy", "treatment", "drug", "clinical"};

void index_keyword(std::unordered_map<std::string, std::vector<std::string>>& index,
                   const std::string& keyword, const std::string& tag) {
    auto& owners = index[keyword];
    if (std::find(owners.begin(), owners.end(), tag) == owners.end()) owners.push_back(tag);
}

// Word runs of the text, as `\b\w+\b` would find them
std::set<std::string> word_tokens(std::string_view text) {
    std::set<std::string> out;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_word_byte(text[i])) { ++i; continue; }
        size_t start = i;
        while (i < text.size() && is_word_byte(text[i])) ++i;
        out.emplace(text.substr(start, i - start));
    }
    return out;
}

} // namespace

TagMatcher::TagMatcher(const TagTaxonomy& taxonomy) {
    std::unordered_set<std::string> seen;

    for (const auto& def : taxonomy) {
        if (def.name.empty() || !seen.insert(def.name).second) continue;

        // The tag name always counts as one of its own keywords
        std::vector<std::string> keywords;
        std::string name_lower = to_lower(trim(def.name));
        keywords.push_back(name_lower);
        for (const auto& kw : def.keywords) {
            std::string k = to_lower(trim(kw));
            if (!k.empty() && std::find(keywords.begin(), keywords.end(), k) == keywords.end()) {
                keywords.push_back(k);
            }
        }

        std::string pattern = "\\b(?:";
        for (size_t i = 0; i < keywords.size(); ++i) {
            if (i > 0) pattern += '|';
            pattern += regex_escape(keywords[i]);
            index_keyword(keyword_to_tags_, keywords[i], def.name);
        }
        pattern += ")\\b";

        tags_.push_back({def.name, def.category,
                         std::regex(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize)});
    }

    Logger::debug("TagMatcher compiled " + std::to_string(tags_.size()) + " tag patterns, " +
                  std::to_string(keyword_to_tags_.size()) + " indexed keywords");
}

std::set<std::string> TagMatcher::match_hints(std::string_view hints) const {
    std::set<std::string> matched;
    for (const auto& token : split_any(hints, ";,|")) {
        auto it = keyword_to_tags_.find(to_lower(token));
        if (it != keyword_to_tags_.end()) matched.insert(it->second.begin(), it->second.end());
    }
    return matched;
}

double TagMatcher::score(const CompiledTag& tag, const std::set<std::string>& matches,
                         const std::string& text) const {
    const size_t unique = matches.size();
    double confidence = std::min(0.8, 0.4 + 0.1 * static_cast<double>(unique));

    // Headline proxy: leading tokens of the combined text
    std::vector<std::string> tokens = split_whitespace(text);
    if (tokens.size() > HEADLINE_MIN_TOKENS) {
        tokens.resize(std::min(tokens.size(), HEADLINE_TOKENS));
        std::set<std::string> headline_words = word_tokens(join(tokens, " "));
        for (const auto& m : matches) {
            if (headline_words.count(m)) {
                confidence = std::min(1.0, confidence + 0.2);
                break;
            }
        }
    }

    if (tag.category == "Event" && unique > 1) {
        confidence = std::min(1.0, confidence + 0.1);
    }

    if (tag.category == "Therapy") {
        for (const char* term : kMedicalTerms) {
            if (contains(text, term)) {
                confidence = std::min(1.0, confidence + 0.1);
                break;
            }
        }
    }

    return round2(confidence);
}

std::map<std::string, double> TagMatcher::search_text(const std::string& combined) const {
    std::map<std::string, double> out;
    if (combined.empty()) return out;

    for (const auto& tag : tags_) {
        std::set<std::string> matches;
        for (auto it = std::sregex_iterator(combined.begin(), combined.end(), tag.pattern);
             it != std::sregex_iterator(); ++it) {
            matches.insert(it->str());
        }
        if (!matches.empty()) out[tag.name] = score(tag, matches, combined);
    }
    return out;
}

std::vector<TagMatch> TagMatcher::match(const DocumentRecord& doc, const NormalizedText& text) const {
    std::map<std::string, double> best;

    for (const auto& tag : match_hints(doc.keyword_hints)) {
        best[tag] = HINT_CONFIDENCE;
    }
    for (const auto& [tag, confidence] : search_text(text.combined)) {
        auto it = best.find(tag);
        if (it == best.end()) best.emplace(tag, confidence);
        else it->second = std::max(it->second, confidence);
    }

    std::vector<TagMatch> out;
    out.reserve(best.size());
    for (const auto& [tag, confidence] : best) out.push_back({tag, confidence});

    std::stable_sort(out.begin(), out.end(), [](const TagMatch& a, const TagMatch& b) {
        return a.confidence > b.confidence;
    });
    return out;
}

} // namespace NewsCube
