/**
 * @file dimension_accumulator.hpp
 * @brief Deduplicating Time/Source/Entity candidate sets and key assignment
 *
 * Membership is keyed by identity (date key, trimmed source name,
 * normalized entity name). Keys are assigned only when rows are
 * requested, over the sorted members, so the result is independent of
 * the order and grouping in which candidates were added.
 */

#pragma once

#include <model/document.hpp>
#include <schema/star_schema.hpp>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace NewsCube {

class DimensionAccumulator {
public:
    static constexpr int SOURCE_KEY_BASE = 1;
    static constexpr int ENTITY_KEY_BASE = 200;

    /**
     * @brief Record a raw publication date; unparseable values add the sentinel.
     */
    void add_date(std::string_view raw);

    /**
     * @brief Record a raw source name; invalid names are ignored.
     * @return true if the name was accepted
     */
    bool add_source(std::string_view raw);

    /**
     * @brief Record an entity candidate, keeping the better candidate per identity.
     */
    void add_entity(const EntityCandidate& candidate);

    /**
     * @brief Date, source and every entity of one enriched document.
     */
    void add_document(const EnrichedDocument& doc);

    std::vector<TimeRow> time_rows() const;
    std::vector<SourceRow> source_rows() const;
    std::vector<EntityRow> entity_rows() const;

    size_t time_count() const { return dates_.size(); }
    size_t source_count() const { return sources_.size(); }
    size_t entity_count() const { return entities_.size(); }

private:
    std::map<int, TimeRow> dates_;
    std::map<std::string, std::string> sources_;          // name → type
    std::map<std::string, EntityCandidate> entities_;     // normalized → best candidate
};

} // namespace NewsCube
