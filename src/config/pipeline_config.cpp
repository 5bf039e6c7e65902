/**
 * @file pipeline_config.cpp
 * @brief Environment and command-line configuration
 */

#include <config/pipeline_config.hpp>
#include <utils/text.hpp>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace NewsCube {

namespace {

bool env_value(const char* name, std::string& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    out = v;
    return true;
}

// libpq conninfo value: quoted when empty or containing spaces, quotes or backslashes
std::string conninfo_value(const std::string& v) {
    if (!v.empty() && v.find_first_of(" '\\") == std::string::npos) return v;
    std::string out = "'";
    for (char c : v) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace

// =============================================================================
// DatabaseConfig
// =============================================================================

DatabaseConfig DatabaseConfig::from_env() {
    DatabaseConfig cfg;
    env_value("PGHOST", cfg.host);
    env_value("PGPORT", cfg.port);
    env_value("PGDATABASE", cfg.dbname);
    env_value("PGUSER", cfg.user);
    env_value("PGPASSWORD", cfg.password);
    return cfg;
}

std::string DatabaseConfig::to_conninfo() const {
    std::ostringstream ss;
    ss << "host=" << conninfo_value(host)
       << " port=" << conninfo_value(port)
       << " dbname=" << conninfo_value(dbname)
       << " user=" << conninfo_value(user);
    if (!password.empty()) ss << " password=" << conninfo_value(password);
    return ss.str();
}

// =============================================================================
// PipelineConfig
// =============================================================================

size_t PipelineConfig::parse_batch_size(const std::string& value) {
    std::string v = trim(value);
    if (v.empty() || !is_all_digits(v)) {
        throw std::invalid_argument("Invalid batch size: '" + value + "'");
    }
    unsigned long long n = 0;
    try {
        n = std::stoull(v);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Batch size out of range: " + value);
    }
    if (n == 0) throw std::invalid_argument("Batch size must be greater than 0");
    return static_cast<size_t>(n);
}

PipelineConfig PipelineConfig::from_env() {
    PipelineConfig cfg;
    std::string v;

    env_value("NEWSCUBE_INPUT", cfg.input_path);
    env_value("NEWSCUBE_TAXONOMY", cfg.taxonomy_path);
    env_value("NEWSCUBE_REGISTRY", cfg.registry_path);
    env_value("NEWSCUBE_OUTPUT_DIR", cfg.output_dir);
    env_value("NEWSCUBE_PG_SCHEMA", cfg.pg_schema);
    if (env_value("NEWSCUBE_BATCH_SIZE", v)) cfg.batch_size = parse_batch_size(v);
    if (env_value("NEWSCUBE_LOG_LEVEL", v)) cfg.log_level = Logger::parse_level(v);

    return cfg;
}

void PipelineConfig::apply_args(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--input" || arg == "-i") {
            input_path = value();
        } else if (arg == "--taxonomy") {
            taxonomy_path = value();
        } else if (arg == "--registry") {
            registry_path = value();
        } else if (arg == "--output-dir" || arg == "-o") {
            output_dir = value();
        } else if (arg == "--batch-size") {
            batch_size = parse_batch_size(value());
        } else if (arg == "--no-csv") {
            write_csv = false;
        } else if (arg == "--postgres") {
            use_postgres = true;
        } else if (arg == "--pg-schema") {
            pg_schema = value();
        } else if (arg == "--log-level") {
            log_level = Logger::parse_level(value());
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
}

void PipelineConfig::validate() const {
    if (input_path.empty()) throw std::invalid_argument("No input file given (--input or NEWSCUBE_INPUT)");
    if (batch_size == 0) throw std::invalid_argument("Batch size must be greater than 0");
    if (!write_csv && !use_postgres) throw std::invalid_argument("Nothing to write: --no-csv without --postgres");
    if (write_csv && output_dir.empty()) throw std::invalid_argument("Output directory must not be empty");
    if (use_postgres && pg_schema.empty()) throw std::invalid_argument("PostgreSQL schema name must not be empty");
}

std::string PipelineConfig::usage(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " --input <articles.csv> [options]\n"
       << "\nOptions:\n"
       << "  --input, -i <path>       Article CSV (NEWSCUBE_INPUT)\n"
       << "  --taxonomy <path>        Tag taxonomy CSV (NEWSCUBE_TAXONOMY)\n"
       << "  --registry <path>        Company registry CSV (NEWSCUBE_REGISTRY)\n"
       << "  --output-dir, -o <dir>   CSV output directory (NEWSCUBE_OUTPUT_DIR, default star_schema)\n"
       << "  --batch-size <n>         Rows per batch (NEWSCUBE_BATCH_SIZE, default " << DEFAULT_BATCH_SIZE << ")\n"
       << "  --no-csv                 Do not write CSV output\n"
       << "  --postgres               Load into PostgreSQL (PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD)\n"
       << "  --pg-schema <name>       Target schema (NEWSCUBE_PG_SCHEMA, default star)\n"
       << "  --log-level <level>      debug|info|step|warn|error|off (NEWSCUBE_LOG_LEVEL)\n"
       << "  --help, -h               Show this help\n";
    return ss.str();
}

} // namespace NewsCube
