/**
 * @file company_registry.hpp
 * @brief Known-company registry file (Company_Name[, Entity_Type])
 */

#pragma once

#include <model/taxonomy.hpp>
#include <istream>
#include <string>

namespace NewsCube {

class CompanyRegistryLoader {
public:
    /**
     * @brief Load the registry; an absent file yields an empty list and a warning.
     * @throws std::runtime_error if the file exists but has no company name column
     */
    static CompanyList load(const std::string& path);

    static CompanyList parse(std::istream& in);
};

} // namespace NewsCube
