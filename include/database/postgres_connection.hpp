/**
 * @file postgres_connection.hpp
 * @brief libpq implementation of DatabaseConnection
 */

#pragma once

#include <database/database_connection.hpp>
#include <string>
#include <libpq-fe.h>

namespace NewsCube {

/**
 * @brief Owns one libpq connection for the lifetime of the object
 *
 * Failures throw std::runtime_error with the server message attached.
 */
class PostgresConnection : public DatabaseConnection {
public:
    /**
     * @brief Connect with a libpq connection string
     * @throws std::runtime_error when the server is unreachable or the
     *         connection string is malformed
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection() override;

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    void execute(const std::string& sql) override;
    std::optional<std::string> query_single(const std::string& sql) override;
    void copy_data(const std::string& chunk) override;
    void copy_end(const char* error_msg) override;

private:
    // Throws unless `result` is a success status; clears it on failure
    void check_result(PGresult* result, const char* what);

    PGconn* conn_ = nullptr;
};

} // namespace NewsCube
