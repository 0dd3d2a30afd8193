#pragma once

#include "core/error.hpp"
#include "query/sql_compiler.hpp"
#include "schema/schema_descriptor.hpp"

#include <string>
#include <vector>

namespace polystore {

struct DdlStatement {
    std::string sql;
    bool is_index = false;      // MySQL has no CREATE INDEX IF NOT EXISTS
};

/**
 * @brief Renders a SchemaDescriptor into idempotent DDL for one dialect
 *
 * Output: one CREATE TABLE IF NOT EXISTS, then one CREATE INDEX per
 * declared index. PostgreSQL indexes carry IF NOT EXISTS; MySQL index
 * statements are flagged so the executor can accept "duplicate key name".
 */
class DdlBuilder {
public:
    explicit DdlBuilder(SqlDialect dialect) : dialect_(dialect) {}

    [[nodiscard]] Result<std::vector<DdlStatement>> build(const SchemaDescriptor& schema) const;

    [[nodiscard]] std::string column_definition(const FieldDescriptor& field,
                                                bool inline_primary_key) const;

    [[nodiscard]] static std::string native_type(SqlDialect dialect, SemanticType type);

    /// Literal for a DEFAULT clause; strings single-quoted with '' escaping
    [[nodiscard]] std::string default_literal(const JsonValue& value) const;

private:
    SqlDialect dialect_;
};

} // namespace polystore
