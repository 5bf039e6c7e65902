/**
 * @file csv_table_writer.hpp
 * @brief Write tables as <Table>.csv, all-or-nothing per output directory
 */

#pragma once

#include <output/table_layout.hpp>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace NewsCube {

/**
 * @brief Staged CSV output
 *
 * stage() writes every file into STAGING_DIR under the output directory;
 * commit() moves them into place. A writer destroyed with staged files that
 * were never committed removes the staging directory, so the output
 * directory keeps its previous contents.
 */
class CsvTableWriter {
public:
    static constexpr const char* STAGING_DIR = ".newscube_staging";

    explicit CsvTableWriter(std::filesystem::path output_dir);
    ~CsvTableWriter();

    CsvTableWriter(const CsvTableWriter&) = delete;
    CsvTableWriter& operator=(const CsvTableWriter&) = delete;

    /**
     * @brief Write every table into the staging directory.
     *
     * Replaces anything staged earlier. If any file fails to write, the
     * staging directory is removed before rethrowing.
     *
     * @throws std::runtime_error on I/O failure
     */
    void stage(const std::vector<TableData>& tables);

    /**
     * @brief Move the staged files into the output directory.
     * @throws PipelineStateError if nothing is staged
     */
    void commit();

    // Drop the staged files without touching the output directory
    void discard();

    bool has_staged() const { return !staged_.empty(); }

    // stage() followed by commit()
    void write_all(const std::vector<TableData>& tables);

    /**
     * @brief Header line plus one line per row, RFC-4180 quoting, LF line ends.
     */
    static void write_table(std::ostream& out, const TableData& table);

    /**
     * @brief Quote a field if it contains a comma, quote, CR or LF.
     */
    static std::string quote_field(const std::string& value);

    const std::filesystem::path& output_dir() const { return output_dir_; }

private:
    void write_file(const std::filesystem::path& path, const TableData& table) const;

    std::filesystem::path staging_dir() const;

    std::filesystem::path output_dir_;
    std::vector<std::string> staged_;
};

} // namespace NewsCube
