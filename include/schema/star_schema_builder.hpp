/**
 * @file star_schema_builder.hpp
 * @brief Surrogate keys, fact table, bridge tables and fact aggregates
 */

#pragma once

#include <model/document.hpp>
#include <model/taxonomy.hpp>
#include <schema/star_schema.hpp>
#include <optional>
#include <vector>

namespace NewsCube {

/**
 * @brief Dimensions already assembled from batch accumulators.
 *
 * Any dimension left empty is derived from the documents instead.
 */
struct PrebuiltDimensions {
    std::optional<std::vector<TimeRow>> time;
    std::optional<std::vector<SourceRow>> sources;
    std::optional<std::vector<EntityRow>> entities;
};

class StarSchemaBuilder {
public:
    static constexpr int FACT_ID_BASE = 1001;
    static constexpr int TAG_KEY_BASE = 10;
    static constexpr int DEFAULT_SOURCE_KEY = 1;
    static constexpr double DEFAULT_TAG_CONFIDENCE = 0.5;
    static constexpr size_t UNRESOLVED_SAMPLE = 10;

    /**
     * @brief Assemble all seven tables.
     *
     * Fact rows follow document order. Bridge keys always exist in the
     * dimension tables; links that cannot be resolved are dropped and
     * counted in the report.
     */
    StarSchema build(const std::vector<EnrichedDocument>& docs, const TagTaxonomy& taxonomy,
                     const PrebuiltDimensions& prebuilt = {}) const;

    static std::vector<TimeRow> build_dim_time(const std::vector<EnrichedDocument>& docs);
    static std::vector<SourceRow> build_dim_source(const std::vector<EnrichedDocument>& docs);
    static std::vector<TagRow> build_dim_tag(const TagTaxonomy& taxonomy);
    static std::vector<EntityRow> build_dim_entity(const std::vector<EnrichedDocument>& docs);

    static std::vector<FactRow> build_fact_document(const std::vector<EnrichedDocument>& docs,
                                                    std::vector<TimeRow>& dim_time,
                                                    const std::vector<SourceRow>& dim_source,
                                                    ResolutionReport& report);

    static std::vector<BridgeTagRow> build_bridge_fact_tag(const std::vector<FactRow>& facts,
                                                           const std::vector<EnrichedDocument>& docs,
                                                           const std::vector<TagRow>& dim_tag,
                                                           ResolutionReport& report);

    static std::vector<BridgeEntityRow> build_bridge_fact_entity(const std::vector<FactRow>& facts,
                                                                 const std::vector<EnrichedDocument>& docs,
                                                                 const std::vector<EntityRow>& dim_entity,
                                                                 ResolutionReport& report);

    /**
     * @brief Tag_Count = bridge-tag rows per fact; Has_Key_Event = "Yes" iff > 0.
     */
    static void update_fact_counts(std::vector<FactRow>& facts, const std::vector<BridgeTagRow>& fact_tags);
};

} // namespace NewsCube
