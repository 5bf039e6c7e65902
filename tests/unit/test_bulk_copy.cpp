/**
 * @file test_bulk_copy.cpp
 * @brief Unit tests for COPY escaping and the PostgreSQL DDL builders
 */

#include <gtest/gtest.h>
#include <database/bulk_copy.hpp>
#include <output/postgres_schema_writer.hpp>
#include "recording_connection.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace NewsCube;

// ============================================================================
// COPY text format
// ============================================================================

TEST(BulkCopyTest, EscapeCopyText) {
    EXPECT_EQ(BulkCopy::escape_copy_text("plain text"), "plain text");
    EXPECT_EQ(BulkCopy::escape_copy_text("a\tb"), "a\\tb");
    EXPECT_EQ(BulkCopy::escape_copy_text("line1\nline2\r"), "line1\\nline2\\r");
    EXPECT_EQ(BulkCopy::escape_copy_text("C:\\path"), "C:\\\\path");
    EXPECT_EQ(BulkCopy::escape_copy_text(std::string("a\0b", 3)), "ab");
}

TEST(BulkCopyTest, QuoteIdentifier) {
    EXPECT_EQ(BulkCopy::quote_identifier("Fact_ID"), "\"Fact_ID\"");
    EXPECT_EQ(BulkCopy::quote_identifier("odd\"name"), "\"odd\"\"name\"");
}

TEST(BulkCopyTest, QualifiedName) {
    EXPECT_EQ(BulkCopy::qualified_name("Dim_Tag"), "\"Dim_Tag\"");
    EXPECT_EQ(BulkCopy::qualified_name("star.Dim_Tag"), "\"star\".\"Dim_Tag\"");
}

static TableData bridge_table() {
    TableData t;
    t.name = "Bridge_Fact_Tag";
    t.columns = {{"Fact_ID", "INTEGER"}, {"Tag_Key", "INTEGER"}, {"Confidence_Score", "DOUBLE PRECISION"}};
    t.primary_key = {"Fact_ID", "Tag_Key"};
    return t;
}

static TableData tag_table() {
    TableData t;
    t.name = "Dim_Tag";
    t.columns = {{"Tag_Key", "INTEGER"}, {"Tag_Name", "TEXT"}};
    t.primary_key = {"Tag_Key"};
    return t;
}

// ============================================================================
// Streaming
// ============================================================================

TEST(BulkCopyTest, CopyTableStreamsEscapedRows) {
    RecordingConnection db;
    TableData t = tag_table();
    t.rows = {{"10", "M&A\tdeal"}, {"11", ""}, {"12"}};

    BulkCopy copy(db);
    EXPECT_EQ(copy.copy_table("star.Dim_Tag", t), 3u);

    ASSERT_EQ(db.statements.size(), 2u);
    EXPECT_EQ(db.statements[0], "COPY \"star\".\"Dim_Tag\" (\"Tag_Key\", \"Tag_Name\") FROM STDIN");
    EXPECT_EQ(db.statements[1], "COPY END");
    EXPECT_EQ(db.copied(), "10\tM&A\\tdeal\n11\t\\N\n12\t\\N\n");
}

TEST(BulkCopyTest, SendsOneChunkPerFlushInterval) {
    RecordingConnection db;
    TableData t = tag_table();
    for (int i = 0; i < 5; ++i) t.rows.push_back({std::to_string(i), "tag"});

    BulkCopy copy(db, 2);
    copy.copy_table("Dim_Tag", t);

    ASSERT_EQ(db.chunks.size(), 3u);
    EXPECT_EQ(db.chunks[0], "0\ttag\n1\ttag\n");
    EXPECT_EQ(db.chunks[2], "4\ttag\n");
}

TEST(BulkCopyTest, EmptyTableStillRunsCopy) {
    RecordingConnection db;
    BulkCopy copy(db);
    EXPECT_EQ(copy.copy_table("Dim_Tag", tag_table()), 0u);
    EXPECT_TRUE(db.chunks.empty());
    EXPECT_EQ(db.statements.back(), "COPY END");
}

TEST(BulkCopyTest, FailedSendAbortsCopy) {
    RecordingConnection db;
    db.fail_copy_data = true;
    TableData t = tag_table();
    t.rows = {{"10", "merger"}};

    BulkCopy copy(db);
    EXPECT_THROW(copy.copy_table("Dim_Tag", t), std::runtime_error);
    EXPECT_EQ(db.statements.back(), "COPY ABORT");
}

TEST(BulkCopyTest, OverwideRowAbortsCopy) {
    RecordingConnection db;
    TableData t = tag_table();
    t.rows = {{"10", "merger", "extra"}};

    BulkCopy copy(db);
    EXPECT_THROW(copy.copy_table("Dim_Tag", t), std::runtime_error);
    EXPECT_EQ(db.statements.back(), "COPY ABORT");
    EXPECT_TRUE(db.chunks.empty());
}

TEST(BulkCopyTest, ZeroFlushIntervalRejected) {
    RecordingConnection db;
    EXPECT_THROW(BulkCopy(db, 0), std::invalid_argument);
}

// ============================================================================
// Transactions
// ============================================================================

TEST(TransactionTest, CommitEndsTransaction) {
    RecordingConnection db;
    {
        Transaction tx(db);
        db.execute("CREATE SCHEMA x");
        tx.commit();
    }
    EXPECT_EQ(db.statements, (std::vector<std::string>{"BEGIN", "CREATE SCHEMA x", "COMMIT"}));
}

TEST(TransactionTest, RollsBackWhenLeftUncommitted) {
    RecordingConnection db;
    auto load = [&db] {
        Transaction tx(db);
        db.execute("CREATE SCHEMA x");
        throw std::runtime_error("load failed");
    };
    EXPECT_THROW(load(), std::runtime_error);
    EXPECT_EQ(db.statements, (std::vector<std::string>{"BEGIN", "CREATE SCHEMA x", "ROLLBACK"}));
}

TEST(TransactionTest, FailedRollbackDoesNotThrow) {
    RecordingConnection db;
    db.fail_on = "ROLLBACK";
    EXPECT_NO_THROW({ Transaction tx(db); });
    EXPECT_EQ(db.statements.back(), "ROLLBACK");
}

// ============================================================================
// Schema load
// ============================================================================

TEST(PostgresSchemaWriterTest, WriteLoadsEveryTableInOneTransaction) {
    RecordingConnection db;
    TableData tags = tag_table();
    tags.rows = {{"10", "merger"}, {"11", "fda approval"}};
    TableData links = bridge_table();
    links.rows = {{"1001", "10", "0.9"}};

    PostgresSchemaWriter(db, "star").write({tags, links});

    const std::vector<std::string> expected = {
        "BEGIN",
        "CREATE SCHEMA IF NOT EXISTS \"star\"",
        "DROP TABLE IF EXISTS \"star\".\"Dim_Tag\" CASCADE",
        PostgresSchemaWriter::create_table_sql("star", tags),
        "COPY \"star\".\"Dim_Tag\" (\"Tag_Key\", \"Tag_Name\") FROM STDIN",
        "COPY END",
        "SELECT COUNT(*) FROM \"star\".\"Dim_Tag\"",
        "DROP TABLE IF EXISTS \"star\".\"Bridge_Fact_Tag\" CASCADE",
        PostgresSchemaWriter::create_table_sql("star", links),
        "COPY \"star\".\"Bridge_Fact_Tag\" (\"Fact_ID\", \"Tag_Key\", \"Confidence_Score\") FROM STDIN",
        "COPY END",
        "SELECT COUNT(*) FROM \"star\".\"Bridge_Fact_Tag\"",
        "COMMIT",
    };
    EXPECT_EQ(db.statements, expected);
}

TEST(PostgresSchemaWriterTest, CountMismatchRollsBack) {
    RecordingConnection db;
    db.count_override = "99";
    TableData tags = tag_table();
    tags.rows = {{"10", "merger"}};

    EXPECT_THROW(PostgresSchemaWriter(db, "star").write({tags}), std::runtime_error);
    EXPECT_EQ(db.statements.back(), "ROLLBACK");
}

TEST(PostgresSchemaWriterTest, DdlFailureRollsBack) {
    RecordingConnection db;
    db.fail_on = "CREATE TABLE";

    EXPECT_THROW(PostgresSchemaWriter(db, "star").write({tag_table()}), std::runtime_error);
    EXPECT_EQ(db.statements.back(), "ROLLBACK");
    for (const auto& sql : db.statements) EXPECT_NE(sql, "COMMIT");
}

TEST(PostgresSchemaWriterTest, EmptySchemaNameRejected) {
    RecordingConnection db;
    EXPECT_THROW(PostgresSchemaWriter(db, ""), std::invalid_argument);
}

// ============================================================================
// DDL
// ============================================================================

TEST(PostgresSchemaWriterTest, CreateSchemaSql) {
    EXPECT_EQ(PostgresSchemaWriter::create_schema_sql("star"), "CREATE SCHEMA IF NOT EXISTS \"star\"");
}

TEST(PostgresSchemaWriterTest, DropTableSql) {
    EXPECT_EQ(PostgresSchemaWriter::drop_table_sql("star", bridge_table()),
              "DROP TABLE IF EXISTS \"star\".\"Bridge_Fact_Tag\" CASCADE");
}

TEST(PostgresSchemaWriterTest, CreateTableSql) {
    EXPECT_EQ(PostgresSchemaWriter::create_table_sql("star", bridge_table()),
              "CREATE TABLE \"star\".\"Bridge_Fact_Tag\" (\"Fact_ID\" INTEGER, \"Tag_Key\" INTEGER, "
              "\"Confidence_Score\" DOUBLE PRECISION, PRIMARY KEY (\"Fact_ID\", \"Tag_Key\"))");
}

TEST(PostgresSchemaWriterTest, CreateTableWithoutPrimaryKey) {
    TableData t;
    t.name = "schema_manifest";
    t.columns = {{"Table", "TEXT"}};
    EXPECT_EQ(PostgresSchemaWriter::create_table_sql("star", t),
              "CREATE TABLE \"star\".\"schema_manifest\" (\"Table\" TEXT)");
}
