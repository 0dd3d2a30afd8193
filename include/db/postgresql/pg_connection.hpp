#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"
#include <libpq-fe.h>
#include <mutex>
#include <string>

namespace polystore {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn*. All libpq calls are encapsulated here. Parameterized
 * statements go through PQexecParams in text format.
 */
class PgConnection : public IDbConnection {
public:
    /// Takes ownership of conn
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute_params(const std::string& sql,
                               const std::vector<SqlParam>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    /// Converts a PGresult into a DbResultSet and clears it
    DbResultSet consume_result(PGresult* res);

    DbResultSet process_tuples_result(PGresult* res);
    DbResultSet process_command_result(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory (PQconnectdb)
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
    std::string last_error() const override;

private:
    mutable std::mutex mutex_;
    std::string last_error_;
};

} // namespace polystore
