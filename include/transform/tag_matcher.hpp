/**
 * @file tag_matcher.hpp
 * @brief Taxonomy tag detection with confidence scores
 *
 * Two strategies, the higher confidence wins per tag:
 *   1. Hint lookup: keyword-hint tokens in the inverted index → 0.9
 *   2. Text search: whole-word keyword pattern per tag over the combined
 *      normalized text → min(0.8, 0.4 + 0.1 × unique matches) plus boosts
 */

#pragma once

#include <model/document.hpp>
#include <model/taxonomy.hpp>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace NewsCube {

class TagMatcher {
public:
    static constexpr double HINT_CONFIDENCE = 0.9;

    explicit TagMatcher(const TagTaxonomy& taxonomy);

    /**
     * @brief Tags present in a document, by descending confidence (ties by name).
     */
    std::vector<TagMatch> match(const DocumentRecord& doc, const NormalizedText& text) const;

    /**
     * @brief Tag names whose keywords appear in a `;` `,` `|` delimited hint field.
     */
    std::set<std::string> match_hints(std::string_view hints) const;

    /**
     * @brief Text-search confidence per matching tag.
     */
    std::map<std::string, double> search_text(const std::string& combined) const;

    size_t tag_count() const { return tags_.size(); }

private:
    struct CompiledTag {
        std::string name;
        std::string category;
        std::regex pattern;
    };

    double score(const CompiledTag& tag, const std::set<std::string>& matches,
                 const std::string& text) const;

    std::vector<CompiledTag> tags_;
    std::unordered_map<std::string, std::vector<std::string>> keyword_to_tags_;
};

} // namespace NewsCube
