/**
 * @file csv_reader.hpp
 * @brief RFC-4180 record reader for the article, taxonomy and registry files
 */

#pragma once

#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace NewsCube {

/**
 * @brief Streaming CSV reader yielding one logical record at a time.
 *
 * Handles quoted fields, doubled quotes, commas and newlines inside quotes,
 * CRLF line endings and a leading UTF-8 byte-order mark.
 */
class CsvReader {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit CsvReader(const std::string& path);

    /**
     * @brief Read from a caller-owned stream (tests, stdin).
     */
    explicit CsvReader(std::istream& in);

    /**
     * @brief Read the next record into `fields`.
     * @return false at end of input
     */
    bool next(std::vector<std::string>& fields);

    /**
     * @brief 1-based physical line on which the last record started.
     */
    size_t line_number() const { return record_line_; }

    /**
     * @brief The last record hit end of input inside a quoted field.
     *
     * Everything from line_number() to the end of input was read into it.
     */
    bool unterminated_quote() const { return unterminated_; }

    static std::vector<std::string> parse_line(const std::string& line);

private:
    std::unique_ptr<std::ifstream> owned_;
    std::istream* in_;
    size_t line_ = 0;
    size_t record_line_ = 0;
    bool first_ = true;
    bool unterminated_ = false;
};

} // namespace NewsCube
