/**
 * @file postgres_schema_writer.cpp
 * @brief DDL + COPY load of the star schema
 */

#include <output/postgres_schema_writer.hpp>
#include <database/bulk_copy.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <sstream>
#include <stdexcept>

namespace NewsCube {

PostgresSchemaWriter::PostgresSchemaWriter(DatabaseConnection& db, std::string schema)
    : db_(db), schema_(std::move(schema)) {
    if (schema_.empty()) throw std::invalid_argument("PostgreSQL schema name must not be empty");
}

std::string PostgresSchemaWriter::create_schema_sql(const std::string& schema) {
    return "CREATE SCHEMA IF NOT EXISTS " + BulkCopy::quote_identifier(schema);
}

std::string PostgresSchemaWriter::drop_table_sql(const std::string& schema, const TableData& table) {
    return "DROP TABLE IF EXISTS " + BulkCopy::qualified_name(schema + "." + table.name) + " CASCADE";
}

std::string PostgresSchemaWriter::create_table_sql(const std::string& schema, const TableData& table) {
    std::ostringstream sql;
    sql << "CREATE TABLE " << BulkCopy::qualified_name(schema + "." + table.name) << " (";
    for (size_t i = 0; i < table.columns.size(); ++i) {
        if (i) sql << ", ";
        sql << BulkCopy::quote_identifier(table.columns[i].name) << ' ' << table.columns[i].sql_type;
    }
    if (!table.primary_key.empty()) {
        sql << ", PRIMARY KEY (";
        for (size_t i = 0; i < table.primary_key.size(); ++i) {
            if (i) sql << ", ";
            sql << BulkCopy::quote_identifier(table.primary_key[i]);
        }
        sql << ')';
    }
    sql << ')';
    return sql.str();
}

void PostgresSchemaWriter::load_table(const TableData& table) {
    BulkCopy copy(db_);
    copy.copy_table(schema_ + "." + table.name, table);
}

void PostgresSchemaWriter::verify_count(const TableData& table) {
    auto count = db_.query_single("SELECT COUNT(*) FROM " + BulkCopy::qualified_name(schema_ + "." + table.name));
    if (!count || std::stoull(*count) != table.rows.size()) {
        throw std::runtime_error("Row count mismatch in " + table.name + ": expected " +
                                 std::to_string(table.rows.size()) + ", found " +
                                 (count ? *count : std::string("none")));
    }
}

void PostgresSchemaWriter::write(const std::vector<TableData>& tables) {
    Timer timer;
    Transaction tx(db_);

    db_.execute(create_schema_sql(schema_));

    for (const auto& table : tables) {
        db_.execute(drop_table_sql(schema_, table));
        db_.execute(create_table_sql(schema_, table));
        load_table(table);
        verify_count(table);
        Logger::debug("Loaded " + schema_ + "." + table.name + " (" + std::to_string(table.rows.size()) + " rows)");
    }

    tx.commit();
    Logger::success("Loaded " + std::to_string(tables.size()) + " tables into schema '" + schema_ + "' in " +
                    format_elapsed(timer.elapsed_sec()));
}

} // namespace NewsCube
