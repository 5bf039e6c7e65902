/**
 * @file taxonomy_loader.hpp
 * @brief Tag taxonomy from the curated tag sheet (CSV export)
 *
 * Columns: Tag_Name, Tag_Category, Tag_Domain, Keywords[, Individually]
 */

#pragma once

#include <model/taxonomy.hpp>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace NewsCube {

class TaxonomyLoader {
public:
    /**
     * @brief Load a taxonomy file.
     *
     * An absent file is not an error: a warning is logged and the empty
     * taxonomy returned, which turns tag matching into a no-op.
     * @throws std::runtime_error if the file exists but has no Tag_Name column
     */
    static TagTaxonomy load(const std::string& path);

    static TagTaxonomy parse(std::istream& in);

    /**
     * @brief (category, domain) from the fixed category vocabulary.
     */
    static std::pair<std::string, std::string> derive_category(const std::string& tag_name,
                                                               const std::vector<std::string>& keywords);

    /**
     * @brief Inflections and synonyms added for well-known deal/funding tags.
     */
    static std::vector<std::string> keyword_variations(const std::string& tag_name);
};

} // namespace NewsCube
