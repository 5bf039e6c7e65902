/**
 * @file table_layout.hpp
 * @brief Column layout and cell rendering shared by the CSV and PostgreSQL sinks
 */

#pragma once

#include <schema/star_schema.hpp>
#include <transform/entity_extractor.hpp>
#include <string>
#include <vector>

namespace NewsCube {

struct ColumnSpec {
    std::string name;
    std::string sql_type;   // INTEGER, DOUBLE PRECISION, TEXT
};

/**
 * @brief One output table rendered to strings. Blank cells mean "absent".
 */
struct TableData {
    std::string name;
    std::vector<ColumnSpec> columns;
    std::vector<std::string> primary_key;
    std::vector<std::vector<std::string>> rows;

    std::vector<std::string> column_names() const;
};

/**
 * @brief The seven star-schema tables in load order:
 * Fact_Document, Dim_Time, Dim_Source, Dim_Tag, Dim_Entity,
 * Bridge_Fact_Tag, Bridge_Fact_Entity.
 */
std::vector<TableData> tabulate(const StarSchema& schema);

/**
 * @brief Audit table of rejected entity candidates (not part of the schema).
 */
TableData tabulate_rejected(const std::vector<RejectedEntity>& rejected);

} // namespace NewsCube
