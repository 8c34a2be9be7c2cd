/**
 * @file engine_config.hpp
 * @brief Engine configuration: defaults, environment overrides, JSON files
 *
 * Precedence (lowest to highest): compiled defaults, JSON file, environment.
 *
 *   RUSSELL_MAX_DEPTH         reasoning depth ceiling
 *   RUSSELL_DEFAULT_DEPTH     depth used when a caller passes none
 *   RUSSELL_CACHE_CAPACITY    reasoning cache cap (0 = unbounded)
 *   RUSSELL_INITIAL_LAMBDA    starting Λ_total
 *   RUSSELL_LOG_LEVEL         debug|info|step|success|warn|error|silent
 *   RUSSELL_PERSIST           1/true to persist reasoning paths to PostgreSQL
 *   PGHOST PGPORT PGDATABASE PGUSER PGPASSWORD   database connection
 */

#pragma once

#include <utils/logger.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace Russell {

struct ReasoningConfig {
    int max_depth = 10;              // Hard ceiling on requested depth
    int default_depth = 3;           // Depth when none is given
    size_t max_implications = 5;     // One-hop implications explored per pass
    size_t cache_capacity = 0;       // 0 = unbounded
};

struct ReflectionConfig {
    double initial_lambda = 10.0;        // Λ_total at engine start
    double base_growth = 0.1;            // Λ growth target per cycle
    double emergence_target = 2.0;       // Transcendent breakthrough threshold
    double certainty_threshold = 0.7;    // Below this, propose certainty work
    int initial_reasoning_depth = 2;     // Baseline depth before improvements
    int max_reasoning_depth = 10;        // Cap for depth-increase proposals
    size_t rolling_window = 5;           // Emergence samples for the transcendent mean
};

struct SafetyConfig {
    size_t max_paths = 1000;             // System stability bound
};

struct DatabaseConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "russell";
    std::string user = "postgres";
    std::string password;
    std::string schema = "russell";

    /**
     * @brief libpq conninfo string
     */
    std::string conninfo() const;

    /**
     * @brief Read PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD over defaults
     */
    static DatabaseConfig load_from_env();
};

struct RUSSELL_API EngineConfig {
    ReasoningConfig reasoning;
    ReflectionConfig reflection;
    SafetyConfig safety;
    DatabaseConfig database;
    bool persist = false;
    Logger::Level log_level = Logger::Level::Info;

    /**
     * @brief Overlay values present in a JSON object
     *
     * Unknown keys are ignored; wrongly typed values throw std::invalid_argument.
     */
    void apply_json(const nlohmann::json& json);

    /**
     * @brief Overlay RUSSELL_* and PG* environment variables
     */
    void apply_env();

    /**
     * @brief Throws std::invalid_argument when a value is out of range
     */
    void validate() const;

    static EngineConfig load_from_env();

    /**
     * @brief Defaults, then the JSON file, then the environment
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static EngineConfig load_from_file(const std::string& path);
};

} // namespace Russell
