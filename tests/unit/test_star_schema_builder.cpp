/**
 * @file test_star_schema_builder.cpp
 * @brief Unit tests for star schema assembly: keys, facts, bridges and aggregates
 */

#include <gtest/gtest.h>
#include <schema/date_dimension.hpp>
#include <schema/star_schema_builder.hpp>
#include <set>

using namespace NewsCube;

static TagTaxonomy taxonomy() {
    return {
        {"acquisition", "Event", "Business", {"acquire"}},
        {"oncology", "Therapy", "Healthcare", {"tumor"}},
        {"acquisition", "Other", "General", {}},   // duplicate name, ignored
    };
}

static std::vector<EnrichedDocument> documents() {
    std::vector<EnrichedDocument> docs(3);

    docs[0].record.document_id = "D1";
    docs[0].record.date = "2024-01-15";
    docs[0].record.source = "Reuters";
    docs[0].record.headline = "Pfizer buys Seagen";
    docs[0].record.body = "Pfizer Inc. agreed to buy Seagen.";
    docs[0].record.sentiment_score = " 0.35 ";
    docs[0].tags = {{"acquisition", 0.9}, {"not in taxonomy", 0.5}};
    docs[0].entities = {{"Pfizer", "Company", 0.9, 2}, {"Pfizer Inc", "Company", 0.7, 1}};

    docs[1].record.document_id = "";
    docs[1].record.date = "not-a-date";
    docs[1].record.source = "123";
    docs[1].record.headline = "Reata update";
    docs[1].record.sentiment_score = "n/a";
    docs[1].entities = {{"Reata", "Company", 0.9, 1}};

    docs[2].record.document_id = "D3";
    docs[2].record.date = "2024-01-15";
    docs[2].record.source = "STAT News";
    docs[2].record.headline = "Reata Pharmaceuticals trial";
    docs[2].tags = {{"oncology", 0.7}, {"acquisition", 0.6}};
    docs[2].entities = {{"Reata Pharmaceuticals", "Company", 1.0, 3}, {"Mystery Corp", "Company", 0.9, 1}};

    return docs;
}

static bool has_time_key(const StarSchema& s, int key) {
    for (const auto& t : s.time) {
        if (t.date_key == key) return true;
    }
    return false;
}

// ============================================================================
// Dimensions
// ============================================================================

TEST(StarSchemaBuilderTest, DimensionKeys) {
    StarSchema s = StarSchemaBuilder().build(documents(), taxonomy());

    ASSERT_EQ(s.time.size(), 2u);
    EXPECT_EQ(s.time[0].date_key, UNKNOWN_DATE_KEY);
    EXPECT_EQ(s.time[1].date_key, 20240115);

    ASSERT_EQ(s.sources.size(), 2u);
    EXPECT_EQ(s.sources[0].source_key, 1);
    EXPECT_EQ(s.sources[0].name, "Reuters");
    EXPECT_EQ(s.sources[1].name, "STAT News");

    ASSERT_EQ(s.tags.size(), 2u);
    EXPECT_EQ(s.tags[0].tag_key, StarSchemaBuilder::TAG_KEY_BASE);
    EXPECT_EQ(s.tags[0].category, "Event");
    EXPECT_EQ(s.tags[1].tag_key, 11);

    ASSERT_EQ(s.entities.size(), 3u);
    EXPECT_EQ(s.entities[0].name, "Mystery Corp");
    EXPECT_EQ(s.entities[1].name, "Pfizer");
    EXPECT_EQ(s.entities[2].name, "Reata Pharmaceuticals");
    EXPECT_EQ(s.entities[2].entity_key, 202);
}

// ============================================================================
// Facts
// ============================================================================

TEST(StarSchemaBuilderTest, FactRows) {
    StarSchema s = StarSchemaBuilder().build(documents(), taxonomy());
    ASSERT_EQ(s.facts.size(), 3u);

    const FactRow& f1 = s.facts[0];
    EXPECT_EQ(f1.fact_id, StarSchemaBuilder::FACT_ID_BASE);
    EXPECT_EQ(f1.document_id, "D1");
    EXPECT_EQ(f1.date_key, 20240115);
    EXPECT_EQ(f1.year, 2024);
    EXPECT_EQ(f1.quarter, "Q1");
    EXPECT_EQ(f1.source_key, 1);
    EXPECT_EQ(f1.source_type, "Other");
    EXPECT_EQ(f1.sentiment_score, "0.35");
    EXPECT_EQ(f1.document_count, 1);
    EXPECT_EQ(f1.content_hash.size(), 32u);

    const FactRow& f2 = s.facts[1];
    EXPECT_EQ(f2.fact_id, 1002);
    EXPECT_EQ(f2.document_id, "doc_1");
    EXPECT_EQ(f2.sentiment_score, "");
    EXPECT_EQ(f2.source_key, StarSchemaBuilder::DEFAULT_SOURCE_KEY);
    EXPECT_EQ(f2.source_name, "123");
    EXPECT_EQ(f2.source_type, "Unknown");

    EXPECT_EQ(s.facts[2].source_key, 2);
    EXPECT_EQ(s.resolution.default_source_facts, 1u);
}

TEST(StarSchemaBuilderTest, UnparseableDateUsesSentinel) {
    StarSchema s = StarSchemaBuilder().build(documents(), taxonomy());
    const FactRow& f = s.facts[1];
    EXPECT_EQ(f.date_key, UNKNOWN_DATE_KEY);
    EXPECT_EQ(f.year, 1900);
    EXPECT_EQ(f.month, "January");
    EXPECT_TRUE(has_time_key(s, UNKNOWN_DATE_KEY));
}

TEST(StarSchemaBuilderTest, ContentHashDependsOnText) {
    auto docs = documents();
    docs[2].record.headline = docs[0].record.headline;
    docs[2].record.body = docs[0].record.body;
    StarSchema s = StarSchemaBuilder().build(docs, taxonomy());
    EXPECT_EQ(s.facts[0].content_hash, s.facts[2].content_hash);
    EXPECT_NE(s.facts[0].content_hash, s.facts[1].content_hash);
}

// ============================================================================
// Bridges and aggregates
// ============================================================================

TEST(StarSchemaBuilderTest, BridgeTagRowsAndCounts) {
    StarSchema s = StarSchemaBuilder().build(documents(), taxonomy());

    ASSERT_EQ(s.fact_tags.size(), 3u);
    EXPECT_EQ(s.fact_tags[0].fact_id, 1001);
    EXPECT_EQ(s.fact_tags[0].tag_key, 10);
    EXPECT_DOUBLE_EQ(s.fact_tags[0].confidence, 0.9);
    EXPECT_EQ(s.resolution.unresolved_tags, 1u);

    EXPECT_EQ(s.facts[0].tag_count, 1);
    EXPECT_EQ(s.facts[0].has_key_event, "Yes");
    EXPECT_EQ(s.facts[1].tag_count, 0);
    EXPECT_EQ(s.facts[1].has_key_event, "No");
    EXPECT_EQ(s.facts[2].tag_count, 2);
}

TEST(StarSchemaBuilderTest, OutOfRangeConfidenceFallsBackToDefault) {
    auto docs = documents();
    docs[0].tags = {{"acquisition", 1.5}};
    StarSchema s = StarSchemaBuilder().build(docs, taxonomy());
    ASSERT_FALSE(s.fact_tags.empty());
    EXPECT_DOUBLE_EQ(s.fact_tags[0].confidence, StarSchemaBuilder::DEFAULT_TAG_CONFIDENCE);
}

TEST(StarSchemaBuilderTest, BridgeEntityDeduplicatesPerFact) {
    StarSchema s = StarSchemaBuilder().build(documents(), taxonomy());

    // "Pfizer" and "Pfizer Inc" both resolve to Pfizer: one row, max mentions
    ASSERT_EQ(s.fact_entities.size(), 4u);
    EXPECT_EQ(s.fact_entities[0].fact_id, 1001);
    EXPECT_EQ(s.fact_entities[0].entity_key, 201);
    EXPECT_EQ(s.fact_entities[0].mention_count, 2);

    // "Reata" and "Reata Pharmaceuticals" share a key
    EXPECT_EQ(s.fact_entities[1].fact_id, 1002);
    EXPECT_EQ(s.fact_entities[1].entity_key, 202);
    EXPECT_EQ(s.fact_entities[2].entity_key, 202);
    EXPECT_EQ(s.fact_entities[2].mention_count, 3);
    EXPECT_EQ(s.resolution.unresolved_entities, 0u);
}

TEST(StarSchemaBuilderTest, ReferentialIntegrity) {
    StarSchema s = StarSchemaBuilder().build(documents(), taxonomy());

    std::set<int> tag_keys, entity_keys, fact_ids, time_keys;
    for (const auto& t : s.tags) tag_keys.insert(t.tag_key);
    for (const auto& e : s.entities) entity_keys.insert(e.entity_key);
    for (const auto& f : s.facts) fact_ids.insert(f.fact_id);
    for (const auto& t : s.time) time_keys.insert(t.date_key);

    for (const auto& b : s.fact_tags) {
        EXPECT_TRUE(tag_keys.count(b.tag_key));
        EXPECT_TRUE(fact_ids.count(b.fact_id));
        EXPECT_GE(b.confidence, 0.0);
        EXPECT_LE(b.confidence, 1.0);
    }
    for (const auto& b : s.fact_entities) {
        EXPECT_TRUE(entity_keys.count(b.entity_key));
        EXPECT_TRUE(fact_ids.count(b.fact_id));
    }
    for (const auto& f : s.facts) {
        EXPECT_TRUE(time_keys.count(f.date_key));
    }
}

// ============================================================================
// Pre-built dimensions
// ============================================================================

TEST(StarSchemaBuilderTest, PrebuiltDimensionsAreUsedAndCompleted) {
    PrebuiltDimensions prebuilt;
    prebuilt.time = std::vector<TimeRow>{make_time_row({2024, 1, 15})};
    prebuilt.sources = std::vector<SourceRow>{{1, "Reuters", "Other"}, {2, "STAT News", "News"}};
    prebuilt.entities = std::vector<EntityRow>{{200, "Reata Pharmaceuticals", "Company", "Healthcare"}};

    StarSchema s = StarSchemaBuilder().build(documents(), taxonomy(), prebuilt);

    // Sentinel appended for the unparseable date, rows kept sorted
    ASSERT_EQ(s.time.size(), 2u);
    EXPECT_EQ(s.time[0].date_key, UNKNOWN_DATE_KEY);

    ASSERT_EQ(s.entities.size(), 1u);
    // Reata + Reata Pharmaceuticals resolve, Pfizer / Pfizer Inc / Mystery Corp do not
    ASSERT_EQ(s.fact_entities.size(), 2u);
    EXPECT_EQ(s.fact_entities[0].entity_key, 200);
    EXPECT_EQ(s.fact_entities[1].entity_key, 200);

    EXPECT_EQ(s.resolution.unresolved_entities, 3u);
    ASSERT_EQ(s.resolution.unresolved_sample.size(), 3u);
    EXPECT_EQ(s.resolution.unresolved_sample[0], "Mystery Corp");
}

TEST(StarSchemaBuilderTest, EmptyInput) {
    StarSchema s = StarSchemaBuilder().build({}, taxonomy());
    EXPECT_TRUE(s.facts.empty());
    EXPECT_TRUE(s.time.empty());
    EXPECT_EQ(s.tags.size(), 2u);
}
