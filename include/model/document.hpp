/**
 * @file document.hpp
 * @brief Input records and the per-document enrichment attached during a batch
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace NewsCube {

/**
 * @brief One cleaned news article as delivered by upstream ingestion.
 *
 * Absent fields are empty strings.
 */
struct DocumentRecord {
    std::string document_id;
    std::string date;             // ISO-like, may be empty or unparseable
    std::string source;
    std::string headline;
    std::string body;
    std::string consolidated;     // consolidated/tagged body
    std::string keyword_hints;    // pre-extracted hints, delimited by ; , |

    // Pass-through columns for the fact table
    std::string news_link;
    std::string cleaned_text;
    std::string sentiment_score;
    std::string qc_status;
};

/**
 * @brief Matching-ready lowercase views of a document.
 */
struct NormalizedText {
    std::string headline;
    std::string body;
    std::string consolidated;
    std::string combined;         // headline + body + consolidated (unless == body)
};

struct TagMatch {
    std::string tag;
    double confidence = 0.0;
};

/**
 * @brief Organization candidate found in one document, before key resolution.
 */
struct EntityCandidate {
    std::string name;             // display name
    std::string type;             // "Company" / "Organization" / registry type
    double confidence = 0.0;
    int mention_count = 0;
};

/**
 * @brief A document after the normalize → tag → entity steps of its batch.
 */
struct EnrichedDocument {
    DocumentRecord record;
    std::vector<TagMatch> tags;
    std::vector<EntityCandidate> entities;
};

} // namespace NewsCube
