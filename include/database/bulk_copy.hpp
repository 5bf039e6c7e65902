/**
 * @file bulk_copy.hpp
 * @brief Stream table rows into PostgreSQL with COPY FROM STDIN (text format)
 */

#pragma once

#include <database/database_connection.hpp>
#include <output/table_layout.hpp>
#include <string>
#include <vector>

namespace NewsCube {

/**
 * @brief Streams whole tables through one COPY each.
 *
 * Usage:
 *   BulkCopy bc(db);
 *   size_t sent = bc.copy_table("schema.table", table);
 *
 * Notes:
 * - Blank cells and cells missing from a short row are sent as NULL.
 * - Rows go out in chunks of `flush_rows` rows (or sooner once the buffer
 *   passes FLUSH_BYTES).
 * - A failure mid-stream aborts the COPY so the connection stays usable
 *   for rollback, then rethrows.
 * - Not thread-safe; one instance per connection.
 */
class BulkCopy {
public:
    static constexpr size_t DEFAULT_FLUSH_ROWS = 50000;
    static constexpr size_t FLUSH_BYTES = 8u << 20;

    explicit BulkCopy(DatabaseConnection& db, size_t flush_rows = DEFAULT_FLUSH_ROWS);

    BulkCopy(const BulkCopy&) = delete;
    BulkCopy& operator=(const BulkCopy&) = delete;

    /**
     * @brief COPY every row of `table` into `target` ("schema.table" or "table").
     * @return number of rows sent
     */
    size_t copy_table(const std::string& target, const TableData& table);

    /**
     * @brief COPY text-format escaping (backslash, tab, newline, CR; NUL dropped).
     */
    static std::string escape_copy_text(const std::string& value);

    static std::string quote_identifier(const std::string& id);

    /**
     * @brief "schema.table" → "\"schema\".\"table\""
     */
    static std::string qualified_name(const std::string& table_name);

    static std::string copy_sql(const std::string& target, const std::vector<std::string>& columns);

private:
    void append_row(const std::vector<std::string>& values, size_t ncols);
    void send_buffer();

    DatabaseConnection& db_;
    size_t flush_rows_;
    std::string buffer_;
};

} // namespace NewsCube
