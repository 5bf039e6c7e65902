/**
 * @file database_connection.hpp
 * @brief The statements the star-schema load needs from a database
 */

#pragma once

#include <optional>
#include <string>

namespace NewsCube {

/**
 * @brief Connection interface used by BulkCopy and PostgresSchemaWriter
 *
 * Implementations throw std::runtime_error on any failure.
 */
class DatabaseConnection {
public:
    virtual ~DatabaseConnection() = default;

    // Statement with no result rows (DDL, BEGIN/COMMIT, COPY ... FROM STDIN)
    virtual void execute(const std::string& sql) = 0;

    // First column of the first row, nullopt when the result is empty
    virtual std::optional<std::string> query_single(const std::string& sql) = 0;

    // One chunk of an open COPY FROM STDIN
    virtual void copy_data(const std::string& chunk) = 0;

    /**
     * @brief Finish the open COPY. A non-null message aborts it server-side.
     */
    virtual void copy_end(const char* error_msg) = 0;
};

/**
 * @brief RAII transaction guard; rolls back unless committed
 */
class Transaction {
public:
    explicit Transaction(DatabaseConnection& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    DatabaseConnection& db_;
    bool committed_ = false;
};

} // namespace NewsCube
