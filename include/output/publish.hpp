/**
 * @file publish.hpp
 * @brief Write the built tables to every configured sink, all-or-nothing
 */

#pragma once

#include <output/csv_table_writer.hpp>
#include <output/postgres_schema_writer.hpp>
#include <output/table_layout.hpp>
#include <vector>

namespace NewsCube {

/**
 * @brief Stage the CSV files, load PostgreSQL, then commit the CSV files.
 *
 * Either sink may be null. If the database load throws, the staged files are
 * discarded and the CSV output directory keeps its previous contents.
 *
 * @param csv_files tables for the CSV sink (schema plus audit files)
 * @param tables    star-schema tables for the database sink
 */
void publish_tables(CsvTableWriter* csv, const std::vector<TableData>& csv_files,
                    PostgresSchemaWriter* db, const std::vector<TableData>& tables);

} // namespace NewsCube
