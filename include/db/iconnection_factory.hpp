#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace polystore {

/**
 * @brief Abstract factory for creating database connections
 *
 * Each relational backend provides its own factory that wraps the native
 * connect call (PQconnectdb, mysql_real_connect).
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string Backend-specific connection string
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;

    /// Native error text of the most recent failed create(), credentials excluded
    [[nodiscard]] virtual std::string last_error() const { return {}; }
};

} // namespace polystore
