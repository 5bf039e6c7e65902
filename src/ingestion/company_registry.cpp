/**
 * @file company_registry.cpp
 * @brief Company registry loading
 */

#include <ingestion/company_registry.hpp>
#include <ingestion/csv_reader.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace NewsCube {

CompanyList CompanyRegistryLoader::parse(std::istream& in) {
    CsvReader reader(in);

    std::vector<std::string> header;
    if (!reader.next(header)) return {};

    int name_col = -1;
    int type_col = -1;
    for (size_t i = 0; i < header.size(); ++i) {
        std::string h = to_lower(trim(header[i]));
        if (name_col < 0 && (h == "company_name" || h == "company" || h == "name")) name_col = static_cast<int>(i);
        if (type_col < 0 && (h == "entity_type" || h == "type")) type_col = static_cast<int>(i);
    }
    if (name_col < 0) {
        throw std::runtime_error("Company registry has no Company_Name column");
    }

    CompanyList companies;
    std::vector<std::string> row;
    while (reader.next(row)) {
        if (static_cast<size_t>(name_col) >= row.size()) continue;

        CompanyRecord rec;
        rec.name = trim(row[name_col]);
        if (rec.name.empty()) continue;

        if (type_col >= 0 && static_cast<size_t>(type_col) < row.size()) {
            std::string type = trim(row[type_col]);
            if (!type.empty()) rec.entity_type = type;
        }
        companies.push_back(std::move(rec));
    }
    return companies;
}

CompanyList CompanyRegistryLoader::load(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        Logger::warn("Company registry not found" + (path.empty() ? std::string() : ": " + path) +
                     " (known-company scan and registry override disabled)");
        return {};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open company registry: " + path);
    }

    CompanyList companies = parse(file);
    Logger::info("Loaded " + std::to_string(companies.size()) + " registry companies from " + path);
    return companies;
}

} // namespace NewsCube
