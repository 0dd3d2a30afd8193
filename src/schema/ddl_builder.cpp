#include "schema/ddl_builder.hpp"
#include "core/utils.hpp"

#include <format>

namespace polystore {

std::string DdlBuilder::native_type(SqlDialect dialect, SemanticType type) {
    if (dialect == SqlDialect::POSTGRESQL) {
        switch (type) {
            case SemanticType::TEXT: return "TEXT";
            case SemanticType::INTEGER: return "INTEGER";
            case SemanticType::BIGINT: return "BIGINT";
            case SemanticType::FLOAT: return "REAL";
            case SemanticType::DOUBLE: return "DOUBLE PRECISION";
            case SemanticType::BOOLEAN: return "BOOLEAN";
            case SemanticType::DATE: return "DATE";
            case SemanticType::DATETIME: return "TIMESTAMP";
            case SemanticType::JSON: return "JSONB";
            case SemanticType::UUID: return "UUID";
            default: return "VARCHAR(255)";
        }
    }
    switch (type) {
        case SemanticType::TEXT: return "TEXT";
        case SemanticType::INTEGER: return "INT";
        case SemanticType::BIGINT: return "BIGINT";
        case SemanticType::FLOAT: return "FLOAT";
        case SemanticType::DOUBLE: return "DOUBLE";
        case SemanticType::BOOLEAN: return "BOOLEAN";
        case SemanticType::DATE: return "DATE";
        case SemanticType::DATETIME: return "DATETIME";
        case SemanticType::JSON: return "JSON";
        case SemanticType::UUID: return "CHAR(36)";
        default: return "VARCHAR(255)";
    }
}

std::string DdlBuilder::default_literal(const JsonValue& value) const {
    if (value.is_null()) return "NULL";
    if (value.is_boolean()) {
        if (dialect_ == SqlDialect::MYSQL) return value.get<bool>() ? "1" : "0";
        return value.get<bool>() ? "TRUE" : "FALSE";
    }
    if (value.is_number()) return value.to_text();

    std::string text = value.is_string() ? value.get<std::string>() : value.dump();
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') out += '\'';
        if (c == '\\' && dialect_ == SqlDialect::MYSQL) out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

std::string DdlBuilder::column_definition(const FieldDescriptor& field,
                                          bool inline_primary_key) const {
    std::string def = field.name + " ";

    if (field.auto_increment && dialect_ == SqlDialect::POSTGRESQL) {
        def += field.type == SemanticType::BIGINT ? "BIGSERIAL" : "SERIAL";
    } else {
        def += native_type(dialect_, field.type);
    }

    if (field.primary_key && inline_primary_key) def += " PRIMARY KEY";
    if (field.auto_increment && dialect_ == SqlDialect::MYSQL) def += " AUTO_INCREMENT";
    if (!field.nullable && !(field.primary_key && inline_primary_key)) def += " NOT NULL";
    if (field.unique && !field.primary_key) def += " UNIQUE";

    if (!field.default_expression.empty()) {
        def += " DEFAULT " + field.default_expression;
    } else if (field.default_value) {
        // MySQL only accepts literal defaults on TEXT/JSON as parenthesized expressions
        const bool wrap = dialect_ == SqlDialect::MYSQL &&
            (field.type == SemanticType::TEXT || field.type == SemanticType::JSON);
        const auto literal = default_literal(*field.default_value);
        def += " DEFAULT " + (wrap ? "(" + literal + ")" : literal);
    } else if (field.primary_key && field.type == SemanticType::UUID) {
        def += dialect_ == SqlDialect::POSTGRESQL ? " DEFAULT gen_random_uuid()" : " DEFAULT (UUID())";
    }

    return def;
}

Result<std::vector<DdlStatement>> DdlBuilder::build(const SchemaDescriptor& schema) const {
    const auto st = schema.validate();
    if (st.is_error()) {
        return Result<std::vector<DdlStatement>>::propagate(st);
    }

    const bool composite = schema.has_composite_primary_key();

    std::vector<std::string> parts;
    for (const auto& field : schema.fields) {
        parts.push_back(column_definition(field, !composite));
    }

    for (const auto& c : schema.constraints) {
        std::string def = c.name.empty() ? "" : "CONSTRAINT " + c.name + " ";
        const auto cols = utils::join(c.columns, ", ");
        switch (c.kind) {
            case ConstraintKind::PRIMARY_KEY:
                def += std::format("PRIMARY KEY ({})", cols);
                break;
            case ConstraintKind::UNIQUE:
                def += std::format("UNIQUE ({})", cols);
                break;
            case ConstraintKind::FOREIGN_KEY:
                def += std::format("FOREIGN KEY ({}) REFERENCES {} ({})", cols,
                    c.references_table, utils::join(c.references_columns, ", "));
                if (!c.on_delete.empty()) def += " ON DELETE " + c.on_delete;
                break;
        }
        parts.push_back(std::move(def));
    }

    std::vector<DdlStatement> statements;
    statements.push_back({std::format("CREATE TABLE IF NOT EXISTS {} ({})",
        schema.name, utils::join(parts, ", ")), false});

    for (const auto& idx : schema.indexes) {
        const std::string name = idx.name.empty()
            ? std::format("idx_{}_{}", schema.name, utils::join(idx.columns, "_"))
            : idx.name;
        statements.push_back({std::format("CREATE {}INDEX {}{} ON {} ({})",
            idx.unique ? "UNIQUE " : "",
            dialect_ == SqlDialect::POSTGRESQL ? "IF NOT EXISTS " : "",
            name, schema.name, utils::join(idx.columns, ", ")), true});
    }

    return Result<std::vector<DdlStatement>>::ok(std::move(statements));
}

} // namespace polystore
