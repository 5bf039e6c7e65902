/**
 * @file test_tag_matcher.cpp
 * @brief Unit tests for taxonomy tag matching and confidence scoring
 */

#include <gtest/gtest.h>
#include <transform/tag_matcher.hpp>

using namespace NewsCube;

static TagTaxonomy make_taxonomy() {
    return {
        {"acquisition", "Event", "Business", {"acquire", "acquired", "buy"}},
        {"oncology", "Therapy", "Healthcare", {"tumor", "cancer"}},
        {"Merger", "Event", "Business", {}},
        {"phase 3", "Clinical", "Healthcare", {"phase iii"}},
    };
}

static NormalizedText text_of(const std::string& combined) {
    NormalizedText t;
    t.combined = combined;
    return t;
}

static const TagMatch* find_match(const std::vector<TagMatch>& v, const std::string& tag) {
    for (const auto& m : v) {
        if (m.tag == tag) return &m;
    }
    return nullptr;
}

// ============================================================================
// Text scan scoring
// ============================================================================

TEST(TagMatcherTest, AcquisitionMentionedTwice) {
    TagMatcher matcher(make_taxonomy());
    DocumentRecord doc;
    auto tags = matcher.match(doc, text_of(
        "pfizer announced acquisition of seagen pfizer announced acquisition of biotech"));

    const auto* acq = find_match(tags, "acquisition");
    ASSERT_NE(acq, nullptr);
    // one unique keyword: min(0.8, 0.4 + 0.1)
    EXPECT_DOUBLE_EQ(acq->confidence, 0.5);
    EXPECT_GE(acq->confidence, 0.5);
}

TEST(TagMatcherTest, EventBoostForSeveralKeywords) {
    TagMatcher matcher(make_taxonomy());
    auto scores = matcher.search_text("firm acquired rival to buy market share");
    ASSERT_EQ(scores.count("acquisition"), 1u);
    // 0.4 + 0.1 * 2, plus 0.1 for an Event with more than one keyword
    EXPECT_DOUBLE_EQ(scores["acquisition"], 0.7);
}

TEST(TagMatcherTest, HeadlineBoost) {
    TagMatcher matcher(make_taxonomy());
    auto scores = matcher.search_text(
        "merger announced today between two firms in the biotech sector after long talks");
    ASSERT_EQ(scores.count("Merger"), 1u);
    // more than ten tokens and the keyword is among the leading ones
    EXPECT_DOUBLE_EQ(scores["Merger"], 0.7);
}

TEST(TagMatcherTest, TherapyBoostWithMedicalTerm) {
    TagMatcher matcher(make_taxonomy());
    auto scores = matcher.search_text("new oncology drug shrinks tumor");
    ASSERT_EQ(scores.count("oncology"), 1u);
    EXPECT_DOUBLE_EQ(scores["oncology"], 0.7);
}

TEST(TagMatcherTest, WordBoundariesRespected) {
    TagMatcher matcher(make_taxonomy());
    auto scores = matcher.search_text("buyers were unaffected");
    EXPECT_EQ(scores.count("acquisition"), 0u);
}

TEST(TagMatcherTest, TagNameIsImplicitKeyword) {
    TagMatcher matcher(make_taxonomy());
    auto scores = matcher.search_text("merger talks stall");
    EXPECT_EQ(scores.count("Merger"), 1u);
}

TEST(TagMatcherTest, MultiWordKeyword) {
    TagMatcher matcher(make_taxonomy());
    auto scores = matcher.search_text("drug enters phase iii");
    EXPECT_EQ(scores.count("phase 3"), 1u);
}

TEST(TagMatcherTest, EmptyTextNoMatches) {
    TagMatcher matcher(make_taxonomy());
    DocumentRecord doc;
    EXPECT_TRUE(matcher.match(doc, text_of("")).empty());
}

// ============================================================================
// Hint strategy and merging
// ============================================================================

TEST(TagMatcherTest, HintsMatchKeywordsCaseInsensitively) {
    TagMatcher matcher(make_taxonomy());
    auto hits = matcher.match_hints("Acquire; unrelated | TUMOR");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits.count("acquisition"), 1u);
    EXPECT_EQ(hits.count("oncology"), 1u);
}

TEST(TagMatcherTest, HintConfidenceWinsOverScan) {
    TagMatcher matcher(make_taxonomy());
    DocumentRecord doc;
    doc.keyword_hints = "acquire";
    auto tags = matcher.match(doc, text_of("pfizer acquisition news"));

    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0].tag, "acquisition");
    EXPECT_DOUBLE_EQ(tags[0].confidence, TagMatcher::HINT_CONFIDENCE);
}

TEST(TagMatcherTest, OrderedByConfidenceThenName) {
    TagMatcher matcher(make_taxonomy());
    DocumentRecord doc;
    doc.keyword_hints = "phase iii";
    auto tags = matcher.match(doc, text_of("merger and acquisition wave"));

    ASSERT_EQ(tags.size(), 3u);
    EXPECT_EQ(tags[0].tag, "phase 3");
    // equal 0.5 scores fall back to name order
    EXPECT_EQ(tags[1].tag, "Merger");
    EXPECT_EQ(tags[2].tag, "acquisition");

    for (const auto& t : tags) {
        EXPECT_GE(t.confidence, 0.0);
        EXPECT_LE(t.confidence, 1.0);
    }
}

TEST(TagMatcherTest, EmptyTaxonomyMatchesNothing) {
    TagMatcher matcher(TagTaxonomy{});
    DocumentRecord doc;
    doc.keyword_hints = "acquire";
    EXPECT_EQ(matcher.tag_count(), 0u);
    EXPECT_TRUE(matcher.match(doc, text_of("acquisition")).empty());
}
