/**
 * @file pipeline_config.hpp
 * @brief Run configuration: environment first, command-line flags override
 */

#pragma once

#include <utils/logger.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace NewsCube {

/**
 * @brief PostgreSQL connection settings, libpq environment convention.
 */
struct DatabaseConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "newscube";
    std::string user = "postgres";
    std::string password;

    static DatabaseConfig from_env();

    /**
     * @brief "host=... port=... dbname=... user=... [password=...]", values quoted as libpq expects.
     */
    std::string to_conninfo() const;
};

struct PipelineConfig {
    static constexpr size_t DEFAULT_BATCH_SIZE = 5000;

    std::string input_path;
    std::string taxonomy_path;
    std::string registry_path;
    std::string output_dir = "star_schema";
    size_t batch_size = DEFAULT_BATCH_SIZE;

    bool write_csv = true;
    bool use_postgres = false;
    std::string pg_schema = "star";
    Logger::Level log_level = Logger::Level::Info;

    bool show_help = false;

    /**
     * @brief Overlay NEWSCUBE_* variables onto the defaults.
     * @throws std::invalid_argument on an invalid value
     */
    static PipelineConfig from_env();

    /**
     * @brief Overlay command-line flags (argv[0] skipped).
     * @throws std::invalid_argument on unknown flags, missing or invalid values
     */
    void apply_args(int argc, const char* const* argv);

    /**
     * @throws std::invalid_argument if the configuration cannot run
     */
    void validate() const;

    static size_t parse_batch_size(const std::string& value);

    static std::string usage(const std::string& program);
};

} // namespace NewsCube
