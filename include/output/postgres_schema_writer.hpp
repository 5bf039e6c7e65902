/**
 * @file postgres_schema_writer.hpp
 * @brief Load the star schema into PostgreSQL in one transaction
 */

#pragma once

#include <database/database_connection.hpp>
#include <output/table_layout.hpp>
#include <string>
#include <vector>

namespace NewsCube {

/**
 * @brief Recreates the tables under `schema` and streams rows with COPY.
 *
 * The whole load is one transaction: either every table is replaced or
 * the database is left as it was.
 */
class PostgresSchemaWriter {
public:
    PostgresSchemaWriter(DatabaseConnection& db, std::string schema);

    /**
     * @throws std::runtime_error on any database error or row count mismatch
     */
    void write(const std::vector<TableData>& tables);

    static std::string create_schema_sql(const std::string& schema);
    static std::string drop_table_sql(const std::string& schema, const TableData& table);
    static std::string create_table_sql(const std::string& schema, const TableData& table);

private:
    void load_table(const TableData& table);
    void verify_count(const TableData& table);

    DatabaseConnection& db_;
    std::string schema_;
};

} // namespace NewsCube
