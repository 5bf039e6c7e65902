/**
 * @file schema_fingerprint.hpp
 * @brief BLAKE3 fingerprints of emitted tables and the run manifest
 */

#pragma once

#include <output/table_layout.hpp>
#include <string>
#include <vector>

namespace NewsCube {

/**
 * @brief Hex BLAKE3 of a table's header and rows, field-framed and in row order.
 *
 * Two runs emit identical tables iff their fingerprints match.
 */
std::string table_fingerprint(const TableData& table);

/**
 * @brief schema_manifest table: one (Table, Row_Count, Fingerprint) row per input table.
 */
TableData manifest_table(const std::vector<TableData>& tables);

} // namespace NewsCube
