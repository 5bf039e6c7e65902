/**
 * @file newscube_build.cpp
 * @brief Build the news-article star schema from an article CSV
 *
 * Usage: newscube_build --input articles.csv --taxonomy tags.csv --registry companies.csv
 */

#include <config/pipeline_config.hpp>
#include <database/postgres_connection.hpp>
#include <ingestion/company_registry.hpp>
#include <ingestion/record_source.hpp>
#include <ingestion/taxonomy_loader.hpp>
#include <output/csv_table_writer.hpp>
#include <output/postgres_schema_writer.hpp>
#include <output/publish.hpp>
#include <output/schema_fingerprint.hpp>
#include <output/table_layout.hpp>
#include <pipeline/batch_processor.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <iostream>
#include <memory>
#include <optional>

using namespace NewsCube;

static void print_summary(const PipelineResult& result, const std::vector<TableData>& tables) {
    const RunStats& s = result.stats;

    std::cout << "\n=== Star Schema Complete ===\n"
              << "Batches: " << s.batches << "\n"
              << "Documents: " << s.rows << " (" << s.malformed_rows << " malformed rows skipped)\n"
              << "Documents with tags: " << s.documents_with_tags << "\n"
              << "\nTables:\n";
    for (const auto& t : tables) {
        std::cout << "  " << t.name << ": " << t.rows.size() << " rows\n";
    }
    std::cout << "\nLinks:\n"
              << "  Tag links: " << s.tag_links << "\n"
              << "  Entity links: " << s.entity_links << "\n"
              << "  Rejected candidates: " << s.rejected_candidates << "\n"
              << "  Unresolved entities: " << s.unresolved_entities << "\n";
    if (!s.unresolved_sample.empty()) {
        std::cout << "    e.g. " << join(s.unresolved_sample, ", ") << "\n";
    }
    std::cout << "\nElapsed: " << format_elapsed(s.elapsed_sec) << "\n";
}

int main(int argc, char** argv) {
    PipelineConfig config;
    try {
        config = PipelineConfig::from_env();
        config.apply_args(argc, argv);
        if (config.show_help) {
            std::cout << PipelineConfig::usage(argv[0]);
            return 0;
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << PipelineConfig::usage(argv[0]);
        return 1;
    }

    Logger::set_level(config.log_level);

    try {
        Logger::step("Loading reference data");
        TagTaxonomy taxonomy = TaxonomyLoader::load(config.taxonomy_path);
        CompanyList registry = CompanyRegistryLoader::load(config.registry_path);

        Logger::step("Opening " + config.input_path);
        CsvRecordSource source(config.input_path);

        BatchProcessor processor(taxonomy, registry);
        PipelineResult result = processor.run(source, config.batch_size);

        std::vector<TableData> tables = tabulate(result.schema);

        std::vector<TableData> files = tables;
        files.push_back(tabulate_rejected(result.rejected));
        files.push_back(manifest_table(tables));

        std::optional<CsvTableWriter> csv;
        if (config.write_csv) csv.emplace(config.output_dir);

        std::unique_ptr<PostgresConnection> db;
        std::optional<PostgresSchemaWriter> pg;
        if (config.use_postgres) {
            Logger::step("Connecting to PostgreSQL for schema '" + config.pg_schema + "'");
            db = std::make_unique<PostgresConnection>(DatabaseConfig::from_env().to_conninfo());
            pg.emplace(*db, config.pg_schema);
        }

        publish_tables(csv ? &*csv : nullptr, files, pg ? &*pg : nullptr, tables);

        print_summary(result, tables);
        return 0;
    } catch (const std::exception& e) {
        Logger::error(std::string("Build failed: ") + e.what());
        return 1;
    }
}
