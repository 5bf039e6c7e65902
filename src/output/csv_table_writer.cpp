/**
 * @file csv_table_writer.cpp
 * @brief Staged CSV output
 */

#include <output/csv_table_writer.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace NewsCube {

CsvTableWriter::CsvTableWriter(fs::path output_dir) : output_dir_(std::move(output_dir)) {}

CsvTableWriter::~CsvTableWriter() {
    if (has_staged()) discard();
}

std::string CsvTableWriter::quote_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;

    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void CsvTableWriter::write_table(std::ostream& out, const TableData& table) {
    for (size_t i = 0; i < table.columns.size(); ++i) {
        if (i) out << ',';
        out << quote_field(table.columns[i].name);
    }
    out << '\n';

    for (const auto& row : table.rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i) out << ',';
            out << quote_field(row[i]);
        }
        out << '\n';
    }
}

void CsvTableWriter::write_file(const fs::path& path, const TableData& table) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open for writing: " + path.string());
    }

    write_table(out, table);
    out.flush();
    if (!out) {
        throw std::runtime_error("Write failed: " + path.string());
    }
}

fs::path CsvTableWriter::staging_dir() const {
    return output_dir_ / STAGING_DIR;
}

void CsvTableWriter::stage(const std::vector<TableData>& tables) {
    discard();

    const fs::path staging = staging_dir();
    fs::create_directories(staging);

    try {
        for (const auto& table : tables) {
            write_file(staging / (table.name + ".csv"), table);
            staged_.push_back(table.name + ".csv");
            Logger::debug("Staged " + table.name + ".csv (" + std::to_string(table.rows.size()) + " rows)");
        }
    } catch (const std::exception&) {
        discard();
        throw;
    }
}

void CsvTableWriter::commit() {
    if (staged_.empty()) {
        throw PipelineStateError("No CSV tables staged for " + output_dir_.string());
    }

    const fs::path staging = staging_dir();
    for (const auto& file : staged_) {
        fs::rename(staging / file, output_dir_ / file);
    }
    const size_t count = staged_.size();
    staged_.clear();
    fs::remove_all(staging);

    Logger::success("Wrote " + std::to_string(count) + " tables to " + output_dir_.string());
}

void CsvTableWriter::discard() {
    std::error_code ec;
    fs::remove_all(staging_dir(), ec);
    if (ec) Logger::warn("Could not remove " + staging_dir().string() + ": " + ec.message());
    staged_.clear();
}

void CsvTableWriter::write_all(const std::vector<TableData>& tables) {
    stage(tables);
    commit();
}

} // namespace NewsCube
