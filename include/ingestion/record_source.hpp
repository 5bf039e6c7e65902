/**
 * @file record_source.hpp
 * @brief Batch-oriented sources of DocumentRecords
 */

#pragma once

#include <ingestion/csv_reader.hpp>
#include <model/document.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace NewsCube {

/**
 * @brief Pull interface used by the BatchProcessor.
 *
 * Rows are delivered in source order. Implementations own whatever
 * file handles they need; a source is consumed once.
 */
class RecordSource {
public:
    virtual ~RecordSource() = default;

    /**
     * @brief Append up to `max_rows` well-formed records to `out` (cleared first).
     * @return false once the source is exhausted and nothing was read
     */
    virtual bool read_batch(size_t max_rows, std::vector<DocumentRecord>& out) = 0;

    /**
     * @brief Rows dropped so far because their column count differed from the header.
     */
    virtual size_t malformed_rows() const { return 0; }
};

/**
 * @brief Records already in memory (tests, embedding).
 */
class MemoryRecordSource : public RecordSource {
public:
    explicit MemoryRecordSource(std::vector<DocumentRecord> records);

    bool read_batch(size_t max_rows, std::vector<DocumentRecord>& out) override;

private:
    std::vector<DocumentRecord> records_;
    size_t pos_ = 0;
};

/**
 * @brief Article export CSV with a header row.
 *
 * Logical columns are resolved by header name through a fixed alias table.
 */
class CsvRecordSource : public RecordSource {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened or is empty
     * @throws SchemaError if Date, Source or every text column is missing
     */
    explicit CsvRecordSource(const std::string& path);

    /**
     * @brief Same, over a caller-owned stream.
     */
    explicit CsvRecordSource(std::istream& in);

    bool read_batch(size_t max_rows, std::vector<DocumentRecord>& out) override;

    size_t malformed_rows() const override { return malformed_; }

    const std::vector<std::string>& header() const { return header_; }

private:
    // Index of each logical column in the header, -1 when absent
    struct ColumnMap {
        int document_id = -1;
        int date = -1;
        int source = -1;
        int headline = -1;
        int body = -1;
        int consolidated = -1;
        int keyword_hints = -1;
        int news_link = -1;
        int cleaned_text = -1;
        int sentiment_score = -1;
        int qc_status = -1;
    };

    void read_header();
    DocumentRecord to_record(const std::vector<std::string>& fields);

    CsvReader reader_;
    std::vector<std::string> header_;
    ColumnMap columns_;
    size_t ordinal_ = 0;
    size_t malformed_ = 0;
    bool exhausted_ = false;
};

} // namespace NewsCube
