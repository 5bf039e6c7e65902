/**
 * @file test_company_registry.cpp
 * @brief Unit tests for the company registry loader
 */

#include <gtest/gtest.h>
#include <ingestion/company_registry.hpp>
#include <sstream>
#include <stdexcept>

using namespace NewsCube;

TEST(CompanyRegistryTest, ParsesNamesAndTypes) {
    std::istringstream in(
        "Company_Name,Entity_Type\n"
        "Pfizer,Company\n"
        "FDA,Regulator\n"
        ",Company\n"
        "Merck,\n");

    CompanyList list = CompanyRegistryLoader::parse(in);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].name, "Pfizer");
    EXPECT_EQ(list[1].entity_type, "Regulator");
    EXPECT_EQ(list[2].name, "Merck");
    EXPECT_EQ(list[2].entity_type, "Company");
}

TEST(CompanyRegistryTest, NameOnlyColumn) {
    std::istringstream in("company\nReata Pharmaceuticals\n");
    CompanyList list = CompanyRegistryLoader::parse(in);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].entity_type, "Company");
}

TEST(CompanyRegistryTest, RequiresNameColumn) {
    std::istringstream in("Ticker\nPFE\n");
    EXPECT_THROW(CompanyRegistryLoader::parse(in), std::runtime_error);
}

TEST(CompanyRegistryTest, MissingFileYieldsEmptyList) {
    EXPECT_TRUE(CompanyRegistryLoader::load("/nonexistent/newscube/companies.csv").empty());
}
