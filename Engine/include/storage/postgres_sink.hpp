/**
 * @file postgres_sink.hpp
 * @brief Reasoning paths as JSONB rows in PostgreSQL
 *
 *   <schema>.reasoning_path(id TEXT PRIMARY KEY, hash TEXT, query TEXT,
 *                           lambda_impact DOUBLE PRECISION, emergence DOUBLE PRECISION,
 *                           record JSONB, created_at TIMESTAMPTZ)
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <storage/persistence_sink.hpp>
#include <export.hpp>
#include <mutex>
#include <string>

namespace Russell {

class RUSSELL_API PostgresSink : public PersistenceSink {
public:
    /**
     * @throws std::invalid_argument if the schema is not a plain identifier
     */
    PostgresSink(PostgresConnection& db, std::string schema = "russell");

    /**
     * @brief CREATE SCHEMA / TABLE IF NOT EXISTS
     */
    void ensure_schema();

    /**
     * @brief Insert one path; an id already stored is left untouched
     */
    void store(const ReasoningPath& path) override;

    std::string name() const override { return "postgres"; }

    size_t count() const;

    std::string table() const { return schema_ + ".reasoning_path"; }

private:
    PostgresConnection& db_;
    std::string schema_;
    mutable std::mutex mutex_;
};

} // namespace Russell
