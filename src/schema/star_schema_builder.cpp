/**
 * @file star_schema_builder.cpp
 * @brief Star schema assembly
 */

#include <schema/star_schema_builder.hpp>
#include <schema/date_dimension.hpp>
#include <schema/dimension_accumulator.hpp>
#include <schema/entity_resolver.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <set>
#include <unordered_map>

namespace NewsCube {

namespace {

// Trimmed numeric text, or blank
std::string clean_score(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) return s;

    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(value)) return {};
    return s;
}

std::string content_hash(const DocumentRecord& r) {
    BLAKE3Pipeline::Stream stream;
    stream.update_field(r.headline);
    stream.update_field(r.body);
    return BLAKE3Pipeline::to_hex(stream.finalize());
}

} // namespace

// =============================================================================
// Dimensions
// =============================================================================

std::vector<TimeRow> StarSchemaBuilder::build_dim_time(const std::vector<EnrichedDocument>& docs) {
    DimensionAccumulator acc;
    for (const auto& doc : docs) acc.add_date(doc.record.date);
    return acc.time_rows();
}

std::vector<SourceRow> StarSchemaBuilder::build_dim_source(const std::vector<EnrichedDocument>& docs) {
    DimensionAccumulator acc;
    for (const auto& doc : docs) acc.add_source(doc.record.source);
    return acc.source_rows();
}

std::vector<TagRow> StarSchemaBuilder::build_dim_tag(const TagTaxonomy& taxonomy) {
    std::vector<TagRow> rows;
    std::set<std::string> seen;
    int key = TAG_KEY_BASE;

    for (const auto& def : taxonomy) {
        if (def.name.empty() || !seen.insert(def.name).second) continue;
        rows.push_back({key++, def.name, def.category, def.domain});
    }
    return rows;
}

std::vector<EntityRow> StarSchemaBuilder::build_dim_entity(const std::vector<EnrichedDocument>& docs) {
    DimensionAccumulator acc;
    for (const auto& doc : docs) {
        for (const auto& e : doc.entities) acc.add_entity(e);
    }
    return acc.entity_rows();
}

// =============================================================================
// Facts
// =============================================================================

std::vector<FactRow> StarSchemaBuilder::build_fact_document(const std::vector<EnrichedDocument>& docs,
                                                            std::vector<TimeRow>& dim_time,
                                                            const std::vector<SourceRow>& dim_source,
                                                            ResolutionReport& report) {
    std::unordered_map<int, size_t> time_index;
    for (size_t i = 0; i < dim_time.size(); ++i) time_index.emplace(dim_time[i].date_key, i);

    std::unordered_map<std::string, const SourceRow*> source_index;
    for (const auto& row : dim_source) source_index.emplace(row.name, &row);

    std::vector<FactRow> facts;
    facts.reserve(docs.size());

    for (size_t idx = 0; idx < docs.size(); ++idx) {
        const DocumentRecord& r = docs[idx].record;

        FactRow f;
        f.fact_id = FACT_ID_BASE + static_cast<int>(idx);
        f.document_id = trim(r.document_id);
        if (f.document_id.empty()) f.document_id = "doc_" + std::to_string(idx);

        // Time: every fact references a Dim_Time row, the sentinel included
        auto parsed = parse_date(r.date);
        f.date_key = parsed ? date_key(*parsed) : UNKNOWN_DATE_KEY;
        auto t = time_index.find(f.date_key);
        if (t == time_index.end()) {
            dim_time.push_back(parsed ? make_time_row(*parsed) : unknown_time_row());
            t = time_index.emplace(f.date_key, dim_time.size() - 1).first;
        }
        const TimeRow& time = dim_time[t->second];
        f.year = time.year;
        f.quarter = time.quarter;
        f.month = time.month;
        f.date_string = time.date_string;

        std::string source_name = trim(r.source);
        auto s = source_index.find(source_name);
        if (s != source_index.end()) {
            f.source_key = s->second->source_key;
            f.source_name = s->second->name;
            f.source_type = s->second->type;
        } else {
            f.source_key = DEFAULT_SOURCE_KEY;
            f.source_name = source_name.empty() ? "Unknown" : source_name;
            f.source_type = "Unknown";
            ++report.default_source_facts;
        }

        f.headline = trim(r.headline);
        f.body_text = trim(r.body);
        f.news_link = trim(r.news_link);
        f.cleaned_text = trim(r.cleaned_text);
        f.consolidated_text = trim(r.consolidated);
        f.matched_keywords = trim(r.keyword_hints);
        f.sentiment_score = clean_score(r.sentiment_score);
        f.qc_status = trim(r.qc_status);
        f.content_hash = content_hash(r);

        facts.push_back(std::move(f));
    }

    std::sort(dim_time.begin(), dim_time.end(),
              [](const TimeRow& a, const TimeRow& b) { return a.date_key < b.date_key; });
    return facts;
}

// =============================================================================
// Bridges
// =============================================================================

std::vector<BridgeTagRow> StarSchemaBuilder::build_bridge_fact_tag(const std::vector<FactRow>& facts,
                                                                   const std::vector<EnrichedDocument>& docs,
                                                                   const std::vector<TagRow>& dim_tag,
                                                                   ResolutionReport& report) {
    std::unordered_map<std::string, int> tag_to_key;
    for (const auto& row : dim_tag) tag_to_key.emplace(row.name, row.tag_key);

    std::vector<BridgeTagRow> bridge;
    std::set<std::string> missing;

    const size_t n = std::min(facts.size(), docs.size());
    for (size_t i = 0; i < n; ++i) {
        std::set<int> emitted;
        for (const auto& match : docs[i].tags) {
            auto it = tag_to_key.find(match.tag);
            if (it == tag_to_key.end()) {
                missing.insert(match.tag);
                continue;
            }
            if (!emitted.insert(it->second).second) continue;

            double confidence = match.confidence;
            if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
                confidence = DEFAULT_TAG_CONFIDENCE;
            }
            bridge.push_back({facts[i].fact_id, it->second, confidence});
        }
    }

    report.unresolved_tags = missing.size();
    return bridge;
}

std::vector<BridgeEntityRow> StarSchemaBuilder::build_bridge_fact_entity(const std::vector<FactRow>& facts,
                                                                         const std::vector<EnrichedDocument>& docs,
                                                                         const std::vector<EntityRow>& dim_entity,
                                                                         ResolutionReport& report) {
    EntityResolver resolver(dim_entity);

    std::vector<BridgeEntityRow> bridge;
    std::set<std::string> missing;

    const size_t n = std::min(facts.size(), docs.size());
    for (size_t i = 0; i < n; ++i) {
        // One row per (fact, entity); the larger mention count survives
        std::map<int, size_t> position;

        for (const auto& entity : docs[i].entities) {
            std::string name = trim(entity.name);
            if (name.empty()) continue;

            auto key = resolver.resolve(name);
            if (!key) {
                missing.insert(name);
                continue;
            }

            auto it = position.find(*key);
            if (it != position.end()) {
                BridgeEntityRow& row = bridge[it->second];
                row.mention_count = std::max(row.mention_count, entity.mention_count);
                continue;
            }
            position.emplace(*key, bridge.size());
            bridge.push_back({facts[i].fact_id, *key, entity.mention_count});
        }
    }

    report.unresolved_entities = missing.size();
    report.unresolved_sample.clear();
    for (const auto& name : missing) {
        if (report.unresolved_sample.size() >= UNRESOLVED_SAMPLE) break;
        report.unresolved_sample.push_back(name);
    }
    return bridge;
}

void StarSchemaBuilder::update_fact_counts(std::vector<FactRow>& facts, const std::vector<BridgeTagRow>& fact_tags) {
    std::unordered_map<int, int> counts;
    for (const auto& row : fact_tags) ++counts[row.fact_id];

    for (auto& f : facts) {
        auto it = counts.find(f.fact_id);
        f.tag_count = it == counts.end() ? 0 : it->second;
        f.has_key_event = f.tag_count > 0 ? "Yes" : "No";
    }
}

// =============================================================================
// Assembly
// =============================================================================

StarSchema StarSchemaBuilder::build(const std::vector<EnrichedDocument>& docs, const TagTaxonomy& taxonomy,
                                    const PrebuiltDimensions& prebuilt) const {
    StarSchema schema;

    if (prebuilt.time && !prebuilt.time->empty()) {
        schema.time = *prebuilt.time;
        Logger::debug("Using pre-built Dim_Time with " + std::to_string(schema.time.size()) + " rows");
    } else {
        schema.time = build_dim_time(docs);
    }

    if (prebuilt.sources && !prebuilt.sources->empty()) {
        schema.sources = *prebuilt.sources;
        Logger::debug("Using pre-built Dim_Source with " + std::to_string(schema.sources.size()) + " rows");
    } else {
        schema.sources = build_dim_source(docs);
    }

    schema.tags = build_dim_tag(taxonomy);

    if (prebuilt.entities && !prebuilt.entities->empty()) {
        schema.entities = *prebuilt.entities;
        Logger::debug("Using pre-built Dim_Entity with " + std::to_string(schema.entities.size()) + " rows");
    } else {
        schema.entities = build_dim_entity(docs);
    }

    schema.facts = build_fact_document(docs, schema.time, schema.sources, schema.resolution);
    schema.fact_tags = build_bridge_fact_tag(schema.facts, docs, schema.tags, schema.resolution);
    schema.fact_entities = build_bridge_fact_entity(schema.facts, docs, schema.entities, schema.resolution);
    update_fact_counts(schema.facts, schema.fact_tags);

    const ResolutionReport& report = schema.resolution;
    if (report.unresolved_entities > 0) {
        Logger::warn(std::to_string(report.unresolved_entities) +
                     " unique entity names not found in Dim_Entity (sample: " +
                     join(report.unresolved_sample, ", ") + ")");
    }
    if (report.unresolved_tags > 0) {
        Logger::warn(std::to_string(report.unresolved_tags) + " matched tag names not found in Dim_Tag");
    }
    if (report.default_source_facts > 0) {
        Logger::warn(std::to_string(report.default_source_facts) +
                     " facts have no valid source and use the default source key");
    }

    Logger::info("Star schema: " + std::to_string(schema.facts.size()) + " facts, " +
                 std::to_string(schema.time.size()) + " dates, " +
                 std::to_string(schema.sources.size()) + " sources, " +
                 std::to_string(schema.tags.size()) + " tags, " +
                 std::to_string(schema.entities.size()) + " entities, " +
                 std::to_string(schema.fact_tags.size()) + " tag links, " +
                 std::to_string(schema.fact_entities.size()) + " entity links");
    return schema;
}

} // namespace NewsCube
