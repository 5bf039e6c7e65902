/**
 * @file taxonomy.hpp
 * @brief Controlled tag vocabulary and the company registry consumed by the matchers
 */

#pragma once

#include <string>
#include <vector>

namespace NewsCube {

struct TagDefinition {
    std::string name;
    std::string category;         // "Event", "Therapy", "Clinical", ...
    std::string domain;           // "Business", "Healthcare", ...
    std::vector<std::string> keywords;
};

using TagTaxonomy = std::vector<TagDefinition>;

struct CompanyRecord {
    std::string name;
    std::string entity_type = "Company";
};

using CompanyList = std::vector<CompanyRecord>;

} // namespace NewsCube
