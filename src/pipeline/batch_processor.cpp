/**
 * @file batch_processor.cpp
 * @brief Batch scanning and finalization
 */

#include <pipeline/batch_processor.hpp>
#include <schema/star_schema_builder.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace NewsCube {

BatchProcessor::BatchProcessor(const TagTaxonomy& taxonomy, const CompanyList& registry)
    : taxonomy_(taxonomy), matcher_(taxonomy_), extractor_(registry) {
    Logger::debug("Tag matcher: " + std::to_string(matcher_.tag_count()) + " tags, registry: " +
                  std::to_string(extractor_.registry_size()) + " companies");
}

void BatchProcessor::require_scanning(const char* operation) const {
    if (phase_ != Phase::Scanning) {
        throw PipelineStateError(std::string(operation) + " called after finalize()");
    }
}

void BatchProcessor::process_batch(const std::vector<DocumentRecord>& records) {
    require_scanning("process_batch");

    Timer batch_timer;
    const size_t batch_no = batches_.size() + 1;

    std::vector<NormalizedText> texts = normalizer_.normalize_batch(records);
    BatchExtraction extraction = extractor_.batch_extract(records, texts);

    std::vector<EnrichedDocument> enriched;
    enriched.reserve(records.size());
    size_t tagged = 0;

    for (size_t i = 0; i < records.size(); ++i) {
        EnrichedDocument doc;
        doc.record = records[i];
        doc.tags = matcher_.match(records[i], texts[i]);
        doc.entities = std::move(extraction.per_document[i]);
        if (!doc.tags.empty()) ++tagged;

        dimensions_.add_document(doc);
        enriched.push_back(std::move(doc));
    }

    for (const auto& entry : extraction.rejected) rejected_[entry.first] += entry.second;

    documents_ += enriched.size();
    batches_.push_back(std::move(enriched));

    Logger::batch("Batch " + std::to_string(batch_no) + ": " + std::to_string(records.size()) + " docs, " +
                  std::to_string(tagged) + " tagged, " + std::to_string(extraction.dimension.size()) +
                  " entities (" + std::to_string(static_cast<long>(batch_timer.elapsed_ms())) + " ms)");
}

PipelineResult BatchProcessor::finalize() {
    require_scanning("finalize");
    if (batches_.empty()) {
        throw PipelineStateError("finalize() called before any batch was processed");
    }
    phase_ = Phase::Finalized;

    const size_t batch_total = batches_.size();
    Logger::step("Finalizing star schema from " + std::to_string(batch_total) + " batches");

    std::vector<EnrichedDocument> all;
    all.reserve(documents_);
    for (auto& batch : batches_) {
        for (auto& doc : batch) all.push_back(std::move(doc));
    }
    batches_.clear();
    batches_.shrink_to_fit();

    PrebuiltDimensions prebuilt;
    prebuilt.time = dimensions_.time_rows();
    prebuilt.sources = dimensions_.source_rows();
    prebuilt.entities = dimensions_.entity_rows();

    PipelineResult result;
    StarSchemaBuilder builder;
    result.schema = builder.build(all, taxonomy_, prebuilt);
    result.rejected = EntityExtractor::rejected_table(rejected_);

    RunStats& stats = result.stats;
    stats.batches = batch_total;
    stats.rows = all.size();
    stats.malformed_rows = malformed_rows_;
    for (const auto& fact : result.schema.facts) {
        if (fact.tag_count > 0) ++stats.documents_with_tags;
    }
    stats.tag_links = result.schema.fact_tags.size();
    stats.entity_links = result.schema.fact_entities.size();
    stats.rejected_candidates = result.rejected.size();
    stats.unresolved_entities = result.schema.resolution.unresolved_entities;
    stats.unresolved_sample = result.schema.resolution.unresolved_sample;
    stats.elapsed_sec = timer_.elapsed_sec();

    return result;
}

PipelineResult BatchProcessor::run(RecordSource& source, size_t batch_size) {
    if (batch_size == 0) throw std::invalid_argument("batch size must be greater than 0");

    Logger::step("Scanning input in batches of " + std::to_string(batch_size));
    timer_.reset();

    std::vector<DocumentRecord> records;
    while (source.read_batch(batch_size, records)) {
        process_batch(records);
        Logger::debug("Throughput: " + std::to_string(static_cast<long>(timer_.rate(documents_))) + " docs/s");
    }

    malformed_rows_ = source.malformed_rows();
    if (malformed_rows_ > 0) {
        Logger::warn("Skipped " + std::to_string(malformed_rows_) + " malformed rows");
    }

    if (batches_.empty()) {
        throw PipelineStateError("Input contains no well-formed rows");
    }
    return finalize();
}

} // namespace NewsCube
