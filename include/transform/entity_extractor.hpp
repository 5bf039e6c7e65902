/**
 * @file entity_extractor.hpp
 * @brief Organization candidates per article, deduplicated by normalized identity
 *
 * Strategies, in priority order:
 *   1. Keyword hints            (0.9)
 *   2. Known-company text scan  (0.7)
 *   3. Registry override        (1.0, canonical name and type)
 */

#pragma once

#include <model/document.hpp>
#include <model/taxonomy.hpp>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace NewsCube {

/**
 * @brief Candidate that failed validation, with its frequency.
 */
struct RejectedEntity {
    std::string name;
    size_t occurrences = 0;
    std::string reason;
};

/**
 * @brief Result of extracting one batch.
 */
struct BatchExtraction {
    std::vector<std::vector<EntityCandidate>> per_document;  // parallel to the input batch
    std::map<std::string, EntityCandidate> dimension;        // normalized identity → best candidate
    std::map<std::string, size_t> rejected;                  // rejected token → occurrences
};

class EntityExtractor {
public:
    static constexpr double HINT_CONFIDENCE = 0.9;
    static constexpr double TEXT_SCAN_CONFIDENCE = 0.7;
    static constexpr double REGISTRY_CONFIDENCE = 1.0;
    static constexpr const char* ENTITY_DOMAIN = "Healthcare";
    static constexpr const char* REJECT_REASON = "Failed validation (not recognized as company name)";

    /**
     * @brief Build the registry lookup; an empty list disables strategies 2 and 3.
     *
     * Registry names colliding on their normalized form collapse to the
     * longer spelling (on equal length, the one containing a space).
     */
    explicit EntityExtractor(const CompanyList& registry = {});

    /**
     * @brief Entities of one document in first-seen order.
     * @param rejected receives every hint token that failed validation
     */
    std::vector<EntityCandidate> extract(const DocumentRecord& doc, const NormalizedText& text,
                                         std::vector<std::string>* rejected = nullptr) const;

    /**
     * @brief Extract a whole batch and aggregate its dimension candidates.
     */
    BatchExtraction batch_extract(const std::vector<DocumentRecord>& docs,
                                  const std::vector<NormalizedText>& texts) const;

    /**
     * @brief Word-bounded occurrences of `name`, optionally followed by a
     * corporate suffix, in lowercase `text`.
     */
    static int count_mentions(const std::string& name, const std::string& text);

    /**
     * @brief Rejected-candidate table, most frequent first (ties by name).
     */
    static std::vector<RejectedEntity> rejected_table(const std::map<std::string, size_t>& counts);

    /**
     * @brief Merge `candidate` into a normalized-identity map, keeping the better one.
     */
    static void merge_candidate(std::map<std::string, EntityCandidate>& into, const EntityCandidate& candidate);

    size_t registry_size() const { return canonical_.size(); }
    const std::vector<std::string>& known_companies() const { return known_companies_; }

private:
    struct Canonical {
        std::string name;
        std::string type;
    };

    struct Found {
        std::string key;
        EntityCandidate candidate;
    };

    void from_hints(const DocumentRecord& doc, const std::string& full_text,
                    std::vector<Found>& out, std::vector<std::string>* rejected) const;
    void from_known_companies(const std::string& combined, std::vector<Found>& out) const;

    // Single capitalized token written with a corporate suffix somewhere in the article
    static bool attested_with_suffix(const std::string& token, const std::string& full_text);

    std::map<std::string, Canonical> canonical_;   // normalized → registry spelling
    std::vector<std::string> known_companies_;     // sorted, normalized forms + lowercase originals
};

} // namespace NewsCube
