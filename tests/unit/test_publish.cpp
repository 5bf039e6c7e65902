/**
 * @file test_publish.cpp
 * @brief Ordering of the CSV and PostgreSQL sinks
 */

#include <gtest/gtest.h>
#include <output/publish.hpp>
#include "recording_connection.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace NewsCube;

namespace {

class TempDir {
public:
    explicit TempDir(const std::string& name) : path_(fs::temp_directory_path() / name) {
        fs::remove_all(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TableData source_table(const std::string& name) {
    TableData t;
    t.name = "Dim_Source";
    t.columns = {{"Source_Key", "INTEGER"}, {"Source_Name", "TEXT"}};
    t.primary_key = {"Source_Key"};
    t.rows = {{"1", name}};
    return t;
}

} // namespace

TEST(PublishTest, CsvCommittedAfterDatabaseLoad) {
    TempDir dir("newscube_publish_ok_test");
    RecordingConnection conn;
    CsvTableWriter csv(dir.path());
    PostgresSchemaWriter db(conn, "star");
    std::vector<TableData> tables = {source_table("Reuters")};

    publish_tables(&csv, tables, &db, tables);

    EXPECT_EQ(conn.statements.back(), "COMMIT");
    EXPECT_EQ(read_file(dir.path() / "Dim_Source.csv"), "Source_Key,Source_Name\n1,Reuters\n");
    EXPECT_FALSE(fs::exists(dir.path() / CsvTableWriter::STAGING_DIR));
}

TEST(PublishTest, FailedDatabaseLoadKeepsPreviousCsv) {
    TempDir dir("newscube_publish_fail_test");
    CsvTableWriter(dir.path()).write_all({source_table("Reuters")});

    RecordingConnection conn;
    conn.fail_on = "COPY";
    CsvTableWriter csv(dir.path());
    PostgresSchemaWriter db(conn, "star");
    std::vector<TableData> tables = {source_table("STAT News")};

    EXPECT_THROW(publish_tables(&csv, tables, &db, tables), std::runtime_error);

    EXPECT_EQ(conn.statements.back(), "ROLLBACK");
    EXPECT_EQ(read_file(dir.path() / "Dim_Source.csv"), "Source_Key,Source_Name\n1,Reuters\n");
    EXPECT_FALSE(fs::exists(dir.path() / CsvTableWriter::STAGING_DIR));
    EXPECT_FALSE(csv.has_staged());
}

TEST(PublishTest, EitherSinkMayBeAbsent) {
    TempDir dir("newscube_publish_csv_only_test");
    CsvTableWriter csv(dir.path());
    std::vector<TableData> tables = {source_table("Reuters")};

    publish_tables(&csv, tables, nullptr, tables);
    EXPECT_TRUE(fs::exists(dir.path() / "Dim_Source.csv"));

    RecordingConnection conn;
    PostgresSchemaWriter db(conn, "star");
    publish_tables(nullptr, tables, &db, tables);
    EXPECT_EQ(conn.statements.back(), "COMMIT");
}
