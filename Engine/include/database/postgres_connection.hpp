/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection used by the persistence sink
 */

#pragma once

#include <config/engine_config.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace Russell {

/**
 * @brief Owning libpq connection wrapper
 *
 * All statements are parameterized ($1, $2, ...) and sent in text format.
 * Failures throw std::runtime_error carrying the server message.
 */
class RUSSELL_API PostgresConnection {
public:
    explicit PostgresConnection(const DatabaseConfig& config);

    ~PostgresConnection();

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    bool is_connected() const;

    void execute(const std::string& sql, const std::vector<std::string>& params = {});

    std::optional<std::string> query_single(const std::string& sql,
                                            const std::vector<std::string>& params = {});

    /**
     * @brief RAII transaction guard: rolls back unless committed
     */
    class RUSSELL_API Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        PostgresConnection& conn_;
        bool done_ = false;
    };

private:
    void connect(const std::string& conninfo);
    void disconnect();
    PGresult* exec(const std::string& sql, const std::vector<std::string>& params);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Russell
