#include <storage/postgres_sink.hpp>
#include <serialization/record_json.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Russell {

namespace {

bool is_identifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

} // namespace

PostgresSink::PostgresSink(PostgresConnection& db, std::string schema)
    : db_(db), schema_(std::move(schema)) {
    if (!is_identifier(schema_)) {
        throw std::invalid_argument("Invalid schema name: " + schema_);
    }
}

void PostgresSink::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    PostgresConnection::Transaction txn(db_);
    db_.execute("CREATE SCHEMA IF NOT EXISTS " + schema_);
    db_.execute(
        "CREATE TABLE IF NOT EXISTS " + table() + " ("
        "id TEXT PRIMARY KEY, "
        "hash TEXT NOT NULL, "
        "query TEXT NOT NULL, "
        "lambda_impact DOUBLE PRECISION NOT NULL, "
        "emergence DOUBLE PRECISION NOT NULL, "
        "record JSONB NOT NULL, "
        "created_at TIMESTAMPTZ NOT NULL DEFAULT now())");
    txn.commit();
    Logger::debug("Persistence table ready: " + table());
}

void PostgresSink::store(const ReasoningPath& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json record = path;
    record["persisted"] = true;

    PostgresConnection::Transaction txn(db_);
    db_.execute(
        "INSERT INTO " + table() + " (id, hash, query, lambda_impact, emergence, record) "
        "VALUES ($1, $2, $3, $4, $5, $6::jsonb) ON CONFLICT (id) DO NOTHING",
        {
            path.id,
            path.hash,
            path.query,
            text::fixed(path.lambda_impact, 12),
            text::fixed(path.emergence, 12),
            dump_record(record)
        });
    txn.commit();
}

size_t PostgresSink::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = db_.query_single("SELECT COUNT(*) FROM " + table());
    return value ? static_cast<size_t>(std::stoull(*value)) : 0;
}

} // namespace Russell
