#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include "query/query_descriptor.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace polystore {

enum class SqlDialect {
    POSTGRESQL,   // $1, $2, ... ; native RETURNING
    MYSQL,        // ?            ; RETURNING emulated by the executor
};

/**
 * @brief Parameterized statement ready for IDbConnection::execute_params()
 */
struct CompiledStatement {
    std::string sql;
    std::vector<SqlParam> params;
};

/**
 * @brief Compiles a QueryDescriptor into dialect-specific parameterized SQL
 *
 * Identifiers are validated, never quoted or escaped; values always travel
 * as parameters. LIMIT/OFFSET are rendered as validated integer literals.
 * Clause order for SELECT: JOIN, WHERE, GROUP BY, HAVING, ORDER BY,
 * LIMIT, OFFSET.
 */
class SqlCompiler {
public:
    explicit SqlCompiler(SqlDialect dialect) : dialect_(dialect) {}

    [[nodiscard]] SqlDialect dialect() const { return dialect_; }

    [[nodiscard]] Result<CompiledStatement> compile(const QueryDescriptor& desc) const;

    /**
     * @brief SELECT <columns> FROM <table> WHERE <predicates>, used for
     * read-back when the dialect has no RETURNING
     */
    [[nodiscard]] Result<CompiledStatement> compile_lookup(
        const std::string& table,
        const std::vector<std::string>& columns,
        const PredicateList& predicates) const;

    /// "$3" for PostgreSQL, "?" for MySQL; index is 1-based
    [[nodiscard]] std::string placeholder(size_t index) const;

    /// Text form of a JSON value bound as a statement parameter
    [[nodiscard]] SqlParam to_param(const JsonValue& value) const;

    /// [A-Za-z_][A-Za-z0-9_]* with optional dotted qualification
    [[nodiscard]] static bool is_valid_identifier(std::string_view name);

    /// Identifier, "*", "table.*", or AGG(identifier|*) with optional "AS alias"
    [[nodiscard]] static bool is_valid_column_expression(std::string_view expr);

private:
    Result<CompiledStatement> compile_select(const QueryDescriptor& desc) const;
    Result<CompiledStatement> compile_insert(const QueryDescriptor& desc) const;
    Result<CompiledStatement> compile_update(const QueryDescriptor& desc) const;
    Result<CompiledStatement> compile_delete(const QueryDescriptor& desc) const;

    /// Appends "a = $n AND b IS NULL ..." and binds the non-null values
    Status render_conjunction(const PredicateList& predicates, bool allow_aggregates,
                              std::string& sql, std::vector<SqlParam>& params) const;

    Status render_returning(const QueryDescriptor& desc, std::string& sql) const;

    SqlDialect dialect_;
};

} // namespace polystore
