#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace polystore {

/// Bound statement parameter; std::nullopt is SQL NULL
using SqlParam = std::optional<std::string>;

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute()/execute_params().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string error_code;             // SQLSTATE (PostgreSQL) or errno (MySQL)
    bool constraint_violation = false;  // unique / not-null / foreign-key

    // For SELECT / RETURNING
    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<std::vector<std::optional<std::string>>> rows;

    // For DML
    uint64_t affected_rows = 0;
    uint64_t last_insert_id = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement without parameters (DDL, probes)
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a parameterized statement
     * @param sql Statement text with dialect placeholders ($n or ?)
     * @param params Text-form values bound in placeholder order
     */
    [[nodiscard]] virtual DbResultSet execute_params(
        const std::string& sql, const std::vector<SqlParam>& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set query timeout for subsequent queries
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     *
     * PostgreSQL: SET statement_timeout = N
     * MySQL: SET SESSION max_execution_time = N
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    virtual void close() = 0;
};

} // namespace polystore
