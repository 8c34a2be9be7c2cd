/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace Russell {

PostgresConnection::PostgresConnection(const DatabaseConfig& config) {
    connect(config.conninfo());
    Logger::debug("Connected to PostgreSQL " + config.host + ":" + config.port + "/" + config.dbname);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error("PostgreSQL connection failed: " + last_error_);
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

PGresult* PostgresConnection::exec(const std::string& sql, const std::vector<std::string>& params) {
    if (!is_connected()) {
        throw std::runtime_error("Not connected to database");
    }

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.empty() ? nullptr : param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    ExecStatusType status = PQresultStatus(result);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQclear(result);
        throw std::runtime_error("PostgreSQL query failed: " + last_error_);
    }

    return result;
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PQclear(exec(sql, params));
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql,
                                                            const std::vector<std::string>& params) {
    PGresult* result = exec(sql, params);

    std::optional<std::string> value;
    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

// =============================================================================
// Transaction
// =============================================================================

PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.execute("BEGIN");
}

PostgresConnection::Transaction::~Transaction() {
    if (done_) return;
    try {
        conn_.execute("ROLLBACK");
    } catch (const std::exception& e) {
        Logger::error(std::string("Transaction rollback failed: ") + e.what());
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.execute("COMMIT");
    done_ = true;
}

} // namespace Russell
