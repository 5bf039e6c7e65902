/**
 * @file schema_fingerprint.cpp
 * @brief Table fingerprints
 */

#include <output/schema_fingerprint.hpp>
#include <hashing/blake3_pipeline.hpp>

namespace NewsCube {

std::string table_fingerprint(const TableData& table) {
    BLAKE3Pipeline::Stream stream;

    for (const auto& column : table.columns) stream.update_field(column.name);
    stream.end_record();

    for (const auto& row : table.rows) {
        for (const auto& cell : row) stream.update_field(cell);
        stream.end_record();
    }

    return BLAKE3Pipeline::to_hex(stream.finalize());
}

TableData manifest_table(const std::vector<TableData>& tables) {
    TableData manifest;
    manifest.name = "schema_manifest";
    manifest.columns = {{"Table", "TEXT"}, {"Row_Count", "INTEGER"}, {"Fingerprint", "TEXT"}};
    manifest.primary_key = {"Table"};

    for (const auto& table : tables) {
        manifest.rows.push_back({table.name, std::to_string(table.rows.size()), table_fingerprint(table)});
    }
    return manifest;
}

} // namespace NewsCube
