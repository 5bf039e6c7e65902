/**
 * @file postgres_connection.cpp
 * @brief libpq connection, statements and COPY streaming
 */

#include <database/postgres_connection.hpp>
#include <limits>
#include <stdexcept>

namespace NewsCube {

namespace {

std::string server_message(const PGconn* conn) {
    std::string msg = conn ? PQerrorMessage(conn) : "out of memory";
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) msg.pop_back();
    return msg;
}

} // namespace

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string msg = server_message(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("PostgreSQL connection failed: " + msg);
    }
}

PostgresConnection::~PostgresConnection() {
    PQfinish(conn_);
}

void PostgresConnection::check_result(PGresult* result, const char* what) {
    ExecStatusType status = PQresultStatus(result);
    if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK || status == PGRES_COPY_IN) return;

    PQclear(result);
    throw std::runtime_error(std::string(what) + " failed: " + server_message(conn_));
}

void PostgresConnection::execute(const std::string& sql) {
    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result, "PostgreSQL statement");
    PQclear(result);
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql) {
    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result, "PostgreSQL query");

    std::optional<std::string> value;
    if (PQntuples(result) > 0 && PQnfields(result) > 0) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::copy_data(const std::string& chunk) {
    if (chunk.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("COPY chunk too large: " + std::to_string(chunk.size()) + " bytes");
    }
    if (PQputCopyData(conn_, chunk.data(), static_cast<int>(chunk.size())) != 1) {
        throw std::runtime_error("COPY data failed: " + server_message(conn_));
    }
}

void PostgresConnection::copy_end(const char* error_msg) {
    if (PQputCopyEnd(conn_, error_msg) != 1) {
        throw std::runtime_error("COPY end failed: " + server_message(conn_));
    }

    // The COPY command's own result, then the terminating null. An aborted
    // COPY always ends in an error result.
    PGresult* result = PQgetResult(conn_);
    if (error_msg == nullptr) check_result(result, "COPY");
    PQclear(result);
    while ((result = PQgetResult(conn_)) != nullptr) PQclear(result);
}

} // namespace NewsCube
