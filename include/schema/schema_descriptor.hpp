#pragma once

#include "core/error.hpp"
#include "core/json.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polystore {

/// Semantic field types; each provider maps them to a native type
enum class SemanticType {
    STRING,
    TEXT,
    INTEGER,
    BIGINT,
    FLOAT,
    DOUBLE,
    BOOLEAN,
    DATE,
    DATETIME,
    JSON,
    UUID,
};

[[nodiscard]] std::string_view semantic_type_to_string(SemanticType type);

/// Case-insensitive; unknown names fall back to STRING
[[nodiscard]] SemanticType parse_semantic_type(std::string_view name);

struct FieldDescriptor {
    std::string name;
    SemanticType type = SemanticType::STRING;
    bool nullable = true;
    bool unique = false;
    bool primary_key = false;
    bool auto_increment = false;
    std::optional<JsonValue> default_value;     // literal default
    std::string default_expression;             // CURRENT_TIMESTAMP, CURRENT_DATE

    [[nodiscard]] bool has_default() const {
        return default_value.has_value() || !default_expression.empty();
    }
};

struct IndexDescriptor {
    std::string name;                   // empty = idx_<table>_<columns>
    std::vector<std::string> columns;
    bool unique = false;
};

enum class ConstraintKind { PRIMARY_KEY, UNIQUE, FOREIGN_KEY };

struct ConstraintDescriptor {
    ConstraintKind kind = ConstraintKind::UNIQUE;
    std::string name;
    std::vector<std::string> columns;
    std::string references_table;       // FOREIGN_KEY only
    std::vector<std::string> references_columns;
    std::string on_delete;              // CASCADE, SET NULL, RESTRICT, NO ACTION
};

/**
 * @brief Abstract definition of an entity's fields, indexes and constraints
 */
struct SchemaDescriptor {
    std::string name;
    std::vector<FieldDescriptor> fields;
    std::vector<IndexDescriptor> indexes;
    std::vector<ConstraintDescriptor> constraints;

    [[nodiscard]] const FieldDescriptor* find_field(std::string_view field_name) const;

    /// Columns of the primary key: composite constraint, or the flagged field
    [[nodiscard]] std::vector<std::string> primary_key_columns() const;

    [[nodiscard]] bool has_composite_primary_key() const;

    /**
     * @brief Structural checks: valid identifiers, unique field names,
     * one simple primary key unless a PRIMARY_KEY constraint is declared,
     * index/constraint columns refer to declared fields
     */
    [[nodiscard]] Status validate() const;

    /**
     * @brief Parse the JSON form
     *
     * {"name":"users","fields":[{"name":"id","type":"uuid","primaryKey":true},
     *   {"name":"email","type":"string","unique":true,"nullable":false}],
     *  "indexes":[{"columns":["email"]}],
     *  "constraints":[{"type":"foreign_key","columns":["org_id"],
     *                  "references":{"table":"orgs","columns":["id"]}}]}
     */
    [[nodiscard]] static Result<SchemaDescriptor> from_json(const JsonValue& json);

    [[nodiscard]] JsonValue to_json() const;
};

} // namespace polystore
