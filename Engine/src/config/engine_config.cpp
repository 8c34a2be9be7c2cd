/**
 * @file engine_config.cpp
 * @brief Configuration loading
 */

#include <config/engine_config.hpp>
#include <utils/text.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Russell {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

int env_int(const char* name, int fallback) {
    const char* value = env(name);
    if (!value) return fallback;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + value);
    }
}

double env_double(const char* name, double fallback) {
    const char* value = env(name);
    if (!value) return fallback;
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not a number: " + value);
    }
}

bool parse_bool(const std::string& raw) {
    std::string v = text::to_lower(raw);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

template <typename T>
void read(const nlohmann::json& obj, const char* key, T& out) {
    if (!obj.contains(key)) return;
    try {
        out = obj.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("config key '") + key + "': " + e.what());
    }
}

} // namespace

std::string DatabaseConfig::conninfo() const {
    std::ostringstream conninfo;
    conninfo << "host=" << host << " ";
    conninfo << "port=" << port << " ";
    conninfo << "dbname=" << dbname << " ";
    conninfo << "user=" << user;
    if (!password.empty()) {
        conninfo << " password=" << password;
    }
    return conninfo.str();
}

DatabaseConfig DatabaseConfig::load_from_env() {
    DatabaseConfig config;
    if (const char* v = env("PGHOST"))     config.host = v;
    if (const char* v = env("PGPORT"))     config.port = v;
    if (const char* v = env("PGDATABASE")) config.dbname = v;
    if (const char* v = env("PGUSER"))     config.user = v;
    if (const char* v = env("PGPASSWORD")) config.password = v;
    return config;
}

void EngineConfig::apply_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("engine config must be a JSON object");
    }

    if (json.contains("reasoning")) {
        const auto& r = json.at("reasoning");
        read(r, "max_depth", reasoning.max_depth);
        read(r, "default_depth", reasoning.default_depth);
        read(r, "max_implications", reasoning.max_implications);
        read(r, "cache_capacity", reasoning.cache_capacity);
    }

    if (json.contains("reflection")) {
        const auto& r = json.at("reflection");
        read(r, "initial_lambda", reflection.initial_lambda);
        read(r, "base_growth", reflection.base_growth);
        read(r, "emergence_target", reflection.emergence_target);
        read(r, "certainty_threshold", reflection.certainty_threshold);
        read(r, "initial_reasoning_depth", reflection.initial_reasoning_depth);
        read(r, "max_reasoning_depth", reflection.max_reasoning_depth);
        read(r, "rolling_window", reflection.rolling_window);
    }

    if (json.contains("safety")) {
        read(json.at("safety"), "max_paths", safety.max_paths);
    }

    if (json.contains("database")) {
        const auto& d = json.at("database");
        read(d, "host", database.host);
        read(d, "port", database.port);
        read(d, "dbname", database.dbname);
        read(d, "user", database.user);
        read(d, "password", database.password);
        read(d, "schema", database.schema);
    }

    read(json, "persist", persist);

    if (json.contains("log_level")) {
        std::string name;
        read(json, "log_level", name);
        auto level = Logger::parse_level(name);
        if (!level) throw std::invalid_argument("unknown log_level: " + name);
        log_level = *level;
    }
}

void EngineConfig::apply_env() {
    reasoning.max_depth = env_int("RUSSELL_MAX_DEPTH", reasoning.max_depth);
    reasoning.default_depth = env_int("RUSSELL_DEFAULT_DEPTH", reasoning.default_depth);

    int capacity = env_int("RUSSELL_CACHE_CAPACITY", static_cast<int>(reasoning.cache_capacity));
    if (capacity < 0) throw std::invalid_argument("RUSSELL_CACHE_CAPACITY must be >= 0");
    reasoning.cache_capacity = static_cast<size_t>(capacity);

    reflection.initial_lambda = env_double("RUSSELL_INITIAL_LAMBDA", reflection.initial_lambda);

    if (const char* v = env("RUSSELL_PERSIST")) persist = parse_bool(v);

    if (const char* v = env("RUSSELL_LOG_LEVEL")) {
        auto level = Logger::parse_level(text::to_lower(v));
        if (!level) throw std::invalid_argument(std::string("unknown RUSSELL_LOG_LEVEL: ") + v);
        log_level = *level;
    }

    DatabaseConfig from_env = DatabaseConfig::load_from_env();
    if (env("PGHOST"))     database.host = from_env.host;
    if (env("PGPORT"))     database.port = from_env.port;
    if (env("PGDATABASE")) database.dbname = from_env.dbname;
    if (env("PGUSER"))     database.user = from_env.user;
    if (env("PGPASSWORD")) database.password = from_env.password;
}

void EngineConfig::validate() const {
    if (reasoning.max_depth < 1) {
        throw std::invalid_argument("reasoning.max_depth must be >= 1");
    }
    if (reasoning.default_depth < 1 || reasoning.default_depth > reasoning.max_depth) {
        throw std::invalid_argument("reasoning.default_depth must be in [1, max_depth]");
    }
    if (reflection.base_growth < 0.0) {
        // Λ_total may never decrease
        throw std::invalid_argument("reflection.base_growth must be non-negative");
    }
    if (reflection.certainty_threshold < 0.0 || reflection.certainty_threshold > 1.0) {
        throw std::invalid_argument("reflection.certainty_threshold must be in [0, 1]");
    }
    if (reflection.initial_reasoning_depth < 1 ||
        reflection.initial_reasoning_depth > reflection.max_reasoning_depth) {
        throw std::invalid_argument("reflection.initial_reasoning_depth must be in [1, max_reasoning_depth]");
    }
    if (reflection.rolling_window == 0) {
        throw std::invalid_argument("reflection.rolling_window must be >= 1");
    }
}

EngineConfig EngineConfig::load_from_env() {
    EngineConfig config;
    config.apply_env();
    config.validate();
    return config;
}

EngineConfig EngineConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }

    EngineConfig config;
    config.apply_json(json);
    config.apply_env();
    config.validate();
    return config;
}

} // namespace Russell
