#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iexecutor.hpp"
#include "db/pooled_connection.hpp"
#include "query/sql_compiler.hpp"
#include "schema/ddl_builder.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace polystore {

/**
 * @brief Decode text-form result cells into typed JSON records
 *
 * Integers, floats and booleans arrive typed, JSON columns parsed, SQL NULL
 * as null; everything else stays a string.
 */
[[nodiscard]] std::vector<JsonValue> decode_result_rows(const DbResultSet& rs);

/**
 * @brief Executor for the relational family (PostgreSQL, MySQL)
 *
 * Owns the provider's connection pool. Each execute() borrows one pooled
 * connection for its whole duration, so multi-statement work (RETURNING
 * emulation on MySQL) runs on a single session.
 */
class RelationalExecutor : public IExecutor {
public:
    RelationalExecutor(std::string name, ProviderKind kind,
                       std::shared_ptr<IConnectionPool> pool,
                       std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds{5000});

    ~RelationalExecutor() override;

    const std::string& name() const override { return name_; }
    ProviderKind kind() const override { return kind_; }

    Result<QueryOutput> execute(const QueryDescriptor& desc) override;
    Result<SchemaApplyResult> ensure_schema(const SchemaDescriptor& schema) override;
    Status ping() override;
    Status close() override;

    [[nodiscard]] const SqlCompiler& compiler() const { return compiler_; }

private:
    /// Key layout remembered from ensure_schema(), used for read-back
    struct TableKeys {
        std::vector<std::string> primary_key;
        std::string auto_increment;
        std::string uuid_key;
    };

    Result<std::unique_ptr<PooledConnection>> borrow();

    Result<DbResultSet> run(PooledConnection& conn, const CompiledStatement& stmt,
                            std::string_view operation);

    /// MySQL: INSERT/UPDATE/DELETE followed or preceded by a SELECT
    Result<QueryOutput> execute_with_readback(PooledConnection& conn, QueryDescriptor desc);

    std::optional<TableKeys> table_keys(const std::string& table) const;

    std::string name_;
    ProviderKind kind_;
    std::shared_ptr<IConnectionPool> pool_;
    std::chrono::milliseconds acquire_timeout_;
    SqlCompiler compiler_;
    DdlBuilder ddl_;

    mutable std::mutex keys_mutex_;
    std::unordered_map<std::string, TableKeys> table_keys_;

    std::atomic<bool> closed_{false};
};

} // namespace polystore
