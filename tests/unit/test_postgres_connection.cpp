/**
 * @file test_postgres_connection.cpp
 * @brief Connection failures that need no running server
 */

#include <gtest/gtest.h>
#include <database/postgres_connection.hpp>
#include <stdexcept>
#include <string>

using namespace NewsCube;

static std::string connect_error(const std::string& conninfo) {
    try {
        PostgresConnection db(conninfo);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

TEST(PostgresConnectionTest, MalformedConninfoThrows) {
    std::string err = connect_error("definitely_not_an_option=1");
    EXPECT_EQ(err.rfind("PostgreSQL connection failed: ", 0), 0u) << err;
    EXPECT_NE(err.find("definitely_not_an_option"), std::string::npos) << err;
}

TEST(PostgresConnectionTest, UnreachableServerThrows) {
    std::string err = connect_error("host=/nonexistent_newscube_socket_dir port=5432 dbname=newscube connect_timeout=1");
    EXPECT_EQ(err.rfind("PostgreSQL connection failed: ", 0), 0u) << err;
}
