/**
 * @file batch_processor.hpp
 * @brief Two-phase (scan, finalize) orchestration of the star-schema build
 *
 * Scanning: each batch is normalized, tagged and entity-extracted, kept in
 * memory, and its date/source/entity candidates are merged into the
 * dimension accumulator.
 *
 * Finalizing: dimensions are built once from the accumulator and handed
 * to StarSchemaBuilder together with every processed document.
 *
 * Output does not depend on batch size.
 */

#pragma once

#include <ingestion/record_source.hpp>
#include <model/document.hpp>
#include <model/taxonomy.hpp>
#include <schema/dimension_accumulator.hpp>
#include <schema/star_schema.hpp>
#include <transform/entity_extractor.hpp>
#include <transform/tag_matcher.hpp>
#include <transform/text_normalizer.hpp>
#include <utils/time.hpp>
#include <map>
#include <string>
#include <vector>

namespace NewsCube {

struct RunStats {
    size_t batches = 0;
    size_t rows = 0;                      // well-formed rows processed
    size_t malformed_rows = 0;
    size_t documents_with_tags = 0;
    size_t tag_links = 0;
    size_t entity_links = 0;
    size_t rejected_candidates = 0;       // distinct rejected names
    size_t unresolved_entities = 0;
    std::vector<std::string> unresolved_sample;
    double elapsed_sec = 0.0;
};

struct PipelineResult {
    StarSchema schema;
    std::vector<RejectedEntity> rejected;
    RunStats stats;
};

class BatchProcessor {
public:
    enum class Phase {
        Scanning,
        Finalized
    };

    BatchProcessor(const TagTaxonomy& taxonomy, const CompanyList& registry = {});

    /**
     * @brief Enrich one batch and merge its dimension candidates.
     * @throws PipelineStateError after finalize()
     */
    void process_batch(const std::vector<DocumentRecord>& records);

    /**
     * @brief Build the star schema from everything scanned so far.
     * @throws PipelineStateError when called twice or before any batch
     */
    PipelineResult finalize();

    /**
     * @brief Drain `source` in chunks of `batch_size`, then finalize.
     * @throws std::invalid_argument if batch_size is 0
     */
    PipelineResult run(RecordSource& source, size_t batch_size);

    Phase phase() const { return phase_; }
    size_t batch_count() const { return batches_.size(); }
    size_t document_count() const { return documents_; }
    const DimensionAccumulator& accumulator() const { return dimensions_; }

private:
    void require_scanning(const char* operation) const;

    TagTaxonomy taxonomy_;
    TextNormalizer normalizer_;
    TagMatcher matcher_;
    EntityExtractor extractor_;

    DimensionAccumulator dimensions_;
    std::vector<std::vector<EnrichedDocument>> batches_;
    std::map<std::string, size_t> rejected_;

    Phase phase_ = Phase::Scanning;
    size_t documents_ = 0;
    size_t malformed_rows_ = 0;
    Timer timer_;
};

} // namespace NewsCube
