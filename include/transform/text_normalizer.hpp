/**
 * @file text_normalizer.hpp
 * @brief Matching-ready lowercase text views of news articles
 *
 * Steps per field, in order:
 *   boilerplate removal → lowercase → URL/e-mail removal →
 *   punctuation to space → whitespace collapse →
 *   isolated single-character removal → trim
 *
 * Every step is a linear scan over the field.
 */

#pragma once

#include <model/document.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace NewsCube {

class TextNormalizer {
public:
    TextNormalizer();

    /**
     * @brief Normalize headline, body and consolidated text of one record.
     *
     * Never throws on content; empty fields normalize to "".
     */
    NormalizedText normalize(const DocumentRecord& doc) const;

    std::vector<NormalizedText> normalize_batch(const std::vector<DocumentRecord>& docs) const;

    /**
     * @brief Normalize a single raw field.
     */
    std::string normalize_text(std::string_view raw) const;

    /**
     * @brief Strip subscription, newsletter and correction boilerplate.
     *
     * Sentence-level phrases are removed up to and including the period that
     * closes them. A trailer marker (". Subscribe", ". Contact us", ...) cuts
     * the text after its period.
     */
    std::string remove_boilerplate(std::string_view raw) const;

private:
    /**
     * @brief Case-insensitive phrase spanning part of one sentence.
     *
     * parts[0] is where the match starts; each later part must follow in the
     * same sentence. Each part lists lowercase alternatives.
     */
    struct BoilerplatePhrase {
        std::vector<std::vector<std::string>> parts;
    };

    std::vector<BoilerplatePhrase> boilerplate_;
    std::vector<std::string> ending_markers_;
};

} // namespace NewsCube
