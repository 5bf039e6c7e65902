/**
 * @file test_entity_resolver.cpp
 * @brief Unit tests for tiered entity key resolution
 */

#include <gtest/gtest.h>
#include <schema/entity_resolver.hpp>

using namespace NewsCube;

static std::vector<EntityRow> reata_dimension() {
    return {
        {200, "Reata Pharmaceuticals", "Company", "Healthcare"},
        {201, "Pfizer", "Company", "Healthcare"},
    };
}

TEST(EntityResolverTest, ExactName) {
    EntityResolver r(reata_dimension());
    EXPECT_EQ(r.resolve("Pfizer"), 201);
    EXPECT_EQ(r.resolve("  Reata Pharmaceuticals "), 200);
}

TEST(EntityResolverTest, NormalizedName) {
    EntityResolver r(reata_dimension());
    EXPECT_FALSE(r.by_exact_name("Pfizer Inc.").has_value());
    EXPECT_EQ(r.by_normalized_name("Pfizer Inc."), 201);
    EXPECT_EQ(r.resolve("PFIZER, INC."), 201);
}

TEST(EntityResolverTest, ReataVariantsShareOneKey) {
    EntityResolver r(reata_dimension());

    auto short_name = r.resolve("Reata");
    auto full_name = r.resolve("Reata Pharmaceuticals");
    ASSERT_TRUE(short_name.has_value());
    EXPECT_EQ(short_name, full_name);
    EXPECT_EQ(r.by_core_word("Reata"), 200);

    // Only the core word links this spelling to the dimension row
    EXPECT_FALSE(r.by_normalized_name("Reata Pharma Inc").has_value());
    EXPECT_EQ(r.resolve("Reata Pharma Inc"), 200);
}

TEST(EntityResolverTest, CoreWordTieBreaks) {
    EntityResolver r(std::vector<EntityRow>{
        {200, "Acme Rocket Works", "Company", "Healthcare"},
        {201, "Acme Bio", "Company", "Healthcare"},
        {202, "Acme Anvil Supply Depot", "Company", "Healthcare"},
    });

    // Single-word query: shortest full name
    EXPECT_EQ(r.resolve("Acme"), 201);
    // Multi-word query: first candidate by key
    EXPECT_EQ(r.resolve("Acme Widgets"), 200);
}

TEST(EntityResolverTest, Unresolved) {
    EntityResolver r(reata_dimension());
    EXPECT_FALSE(r.resolve("Zymeworks").has_value());
    EXPECT_FALSE(r.resolve("").has_value());
    EXPECT_FALSE(r.resolve("   ").has_value());
}

TEST(EntityResolverTest, EmptyDimension) {
    EntityResolver r(std::vector<EntityRow>{});
    EXPECT_FALSE(r.resolve("Pfizer").has_value());
}
