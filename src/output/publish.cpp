/**
 * @file publish.cpp
 * @brief Sink ordering for one build
 */

#include <output/publish.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace NewsCube {

void publish_tables(CsvTableWriter* csv, const std::vector<TableData>& csv_files,
                    PostgresSchemaWriter* db, const std::vector<TableData>& tables) {
    if (csv) {
        Logger::step("Staging CSV tables in " + csv->output_dir().string());
        csv->stage(csv_files);
    }

    if (db) {
        try {
            db->write(tables);
        } catch (const std::exception&) {
            if (csv) {
                Logger::warn("Database load failed; discarding staged CSV tables");
                csv->discard();
            }
            throw;
        }
    }

    if (csv) csv->commit();
}

} // namespace NewsCube
