#include "schema/schema_descriptor.hpp"
#include "core/utils.hpp"
#include "query/sql_compiler.hpp"

#include <format>
#include <unordered_map>
#include <unordered_set>

namespace polystore {

namespace {

bool valid_name(std::string_view name) {
    return name.find('.') == std::string_view::npos && SqlCompiler::is_valid_identifier(name);
}

std::vector<std::string> string_list(const JsonValue& arr) {
    std::vector<std::string> out;
    for (const auto& elem : arr.elements()) {
        if (elem.is_string()) out.push_back(elem.get<std::string>());
    }
    return out;
}

JsonValue string_array(const std::vector<std::string>& items) {
    JsonValue arr = JsonValue::array();
    for (const auto& s : items) arr.push_back(s);
    return arr;
}

std::string_view constraint_kind_to_string(ConstraintKind kind) {
    switch (kind) {
        case ConstraintKind::PRIMARY_KEY: return "primary_key";
        case ConstraintKind::FOREIGN_KEY: return "foreign_key";
        default: return "unique";
    }
}

} // namespace

std::string_view semantic_type_to_string(SemanticType type) {
    switch (type) {
        case SemanticType::STRING: return "string";
        case SemanticType::TEXT: return "text";
        case SemanticType::INTEGER: return "integer";
        case SemanticType::BIGINT: return "bigint";
        case SemanticType::FLOAT: return "float";
        case SemanticType::DOUBLE: return "double";
        case SemanticType::BOOLEAN: return "boolean";
        case SemanticType::DATE: return "date";
        case SemanticType::DATETIME: return "datetime";
        case SemanticType::JSON: return "json";
        case SemanticType::UUID: return "uuid";
        default: return "string";
    }
}

SemanticType parse_semantic_type(std::string_view name) {
    static const std::unordered_map<std::string, SemanticType> lookup = {
        {"string", SemanticType::STRING},
        {"text", SemanticType::TEXT},
        {"integer", SemanticType::INTEGER},
        {"int", SemanticType::INTEGER},
        {"bigint", SemanticType::BIGINT},
        {"float", SemanticType::FLOAT},
        {"double", SemanticType::DOUBLE},
        {"boolean", SemanticType::BOOLEAN},
        {"bool", SemanticType::BOOLEAN},
        {"date", SemanticType::DATE},
        {"datetime", SemanticType::DATETIME},
        {"timestamp", SemanticType::DATETIME},
        {"json", SemanticType::JSON},
        {"uuid", SemanticType::UUID},
    };
    const auto it = lookup.find(utils::to_lower(std::string(name)));
    return it != lookup.end() ? it->second : SemanticType::STRING;
}

// ============================================================================
// SchemaDescriptor
// ============================================================================

const FieldDescriptor* SchemaDescriptor::find_field(std::string_view field_name) const {
    for (const auto& f : fields) {
        if (f.name == field_name) return &f;
    }
    return nullptr;
}

bool SchemaDescriptor::has_composite_primary_key() const {
    for (const auto& c : constraints) {
        if (c.kind == ConstraintKind::PRIMARY_KEY) return true;
    }
    return false;
}

std::vector<std::string> SchemaDescriptor::primary_key_columns() const {
    for (const auto& c : constraints) {
        if (c.kind == ConstraintKind::PRIMARY_KEY) return c.columns;
    }
    for (const auto& f : fields) {
        if (f.primary_key) return {f.name};
    }
    return {};
}

Status SchemaDescriptor::validate() const {
    auto fail = [](std::string msg) {
        return Status::error(ErrorCategory::VALIDATION_ERROR, std::move(msg));
    };

    if (!valid_name(name)) {
        return fail(std::format("invalid schema name '{}'", name));
    }
    if (fields.empty()) {
        return fail(std::format("schema '{}' has no fields", name));
    }

    std::unordered_set<std::string> seen;
    size_t pk_fields = 0;
    for (const auto& f : fields) {
        if (!valid_name(f.name)) {
            return fail(std::format("invalid field name '{}' in '{}'", f.name, name));
        }
        if (!seen.insert(f.name).second) {
            return fail(std::format("duplicate field '{}' in '{}'", f.name, name));
        }
        if (f.primary_key) ++pk_fields;
        if (f.auto_increment && f.type != SemanticType::INTEGER && f.type != SemanticType::BIGINT) {
            return fail(std::format("auto-increment field '{}' must be integer or bigint", f.name));
        }
        if (!f.default_expression.empty() && f.default_expression != "CURRENT_TIMESTAMP" &&
            f.default_expression != "CURRENT_DATE") {
            return fail(std::format("unsupported default expression '{}' on '{}'",
                f.default_expression, f.name));
        }
    }

    size_t pk_constraints = 0;
    for (const auto& c : constraints) {
        if (c.kind == ConstraintKind::PRIMARY_KEY) ++pk_constraints;
        if (c.columns.empty()) {
            return fail(std::format("constraint on '{}' has no columns", name));
        }
        if (!c.name.empty() && !valid_name(c.name)) {
            return fail(std::format("invalid constraint name '{}'", c.name));
        }
        for (const auto& col : c.columns) {
            if (!seen.contains(col)) {
                return fail(std::format("constraint column '{}' is not a field of '{}'", col, name));
            }
        }
        if (c.kind == ConstraintKind::FOREIGN_KEY) {
            if (!valid_name(c.references_table) ||
                c.references_columns.size() != c.columns.size()) {
                return fail(std::format("foreign key on '{}' needs a referenced table and "
                                        "matching column list", name));
            }
            for (const auto& rc : c.references_columns) {
                if (!valid_name(rc)) return fail(std::format("invalid referenced column '{}'", rc));
            }
            static const std::unordered_set<std::string> ACTIONS = {
                "", "CASCADE", "SET NULL", "RESTRICT", "NO ACTION"};
            if (!ACTIONS.contains(c.on_delete)) {
                return fail(std::format("unsupported on_delete action '{}'", c.on_delete));
            }
        }
    }

    if (pk_constraints > 1) {
        return fail(std::format("schema '{}' declares more than one primary key constraint", name));
    }
    if (pk_fields > 1 && pk_constraints == 0) {
        return fail(std::format("schema '{}' has {} primary key fields; declare a composite "
                                "primary_key constraint instead", name, pk_fields));
    }

    for (const auto& idx : indexes) {
        if (idx.columns.empty()) {
            return fail(std::format("index on '{}' has no columns", name));
        }
        if (!idx.name.empty() && !valid_name(idx.name)) {
            return fail(std::format("invalid index name '{}'", idx.name));
        }
        for (const auto& col : idx.columns) {
            if (!seen.contains(col)) {
                return fail(std::format("index column '{}' is not a field of '{}'", col, name));
            }
        }
    }

    return Status::ok();
}

Result<SchemaDescriptor> SchemaDescriptor::from_json(const JsonValue& json) {
    if (!json.is_object()) {
        return Result<SchemaDescriptor>::error(ErrorCategory::VALIDATION_ERROR,
            "schema descriptor must be a JSON object");
    }

    SchemaDescriptor schema;
    schema.name = json.value("name", std::string{});

    for (const auto& f : json["fields"].elements()) {
        FieldDescriptor field;
        field.name = f.value("name", std::string{});
        field.type = parse_semantic_type(f.value("type", std::string("string")));
        field.nullable = f.value("nullable", true) && !f.value("notNull", false);
        field.unique = f.value("unique", false);
        field.primary_key = f.value("primaryKey", false);
        field.auto_increment = f.value("autoIncrement", false);
        if (f.contains("default")) field.default_value = f["default"];
        field.default_expression = f.value("defaultExpression", std::string{});
        schema.fields.push_back(std::move(field));
    }

    for (const auto& i : json["indexes"].elements()) {
        IndexDescriptor index;
        index.name = i.value("name", std::string{});
        index.columns = string_list(i["columns"]);
        index.unique = i.value("unique", false);
        schema.indexes.push_back(std::move(index));
    }

    for (const auto& c : json["constraints"].elements()) {
        ConstraintDescriptor constraint;
        const std::string kind = utils::to_lower(c.value("type", std::string("unique")));
        if (kind == "primary_key" || kind == "primarykey") {
            constraint.kind = ConstraintKind::PRIMARY_KEY;
        } else if (kind == "foreign_key" || kind == "foreignkey") {
            constraint.kind = ConstraintKind::FOREIGN_KEY;
        } else if (kind == "unique") {
            constraint.kind = ConstraintKind::UNIQUE;
        } else {
            return Result<SchemaDescriptor>::error(ErrorCategory::VALIDATION_ERROR,
                std::format("unknown constraint type '{}'", kind));
        }
        constraint.name = c.value("name", std::string{});
        constraint.columns = string_list(c["columns"]);
        const auto refs = c["references"];
        constraint.references_table = refs.value("table", std::string{});
        constraint.references_columns = string_list(refs["columns"]);
        constraint.on_delete = c.value("onDelete", std::string{});
        schema.constraints.push_back(std::move(constraint));
    }

    const auto st = schema.validate();
    if (st.is_error()) return Result<SchemaDescriptor>::propagate(st);
    return Result<SchemaDescriptor>::ok(std::move(schema));
}

JsonValue SchemaDescriptor::to_json() const {
    JsonValue out = JsonValue::object();
    out.set("name", name);

    JsonValue fields_json = JsonValue::array();
    for (const auto& f : fields) {
        JsonValue fj = JsonValue::object();
        fj.set("name", f.name);
        fj.set("type", std::string(semantic_type_to_string(f.type)));
        fj.set("nullable", f.nullable);
        fj.set("unique", f.unique);
        fj.set("primaryKey", f.primary_key);
        fj.set("autoIncrement", f.auto_increment);
        if (f.default_value) fj.set("default", *f.default_value);
        if (!f.default_expression.empty()) fj.set("defaultExpression", f.default_expression);
        fields_json.push_back(std::move(fj));
    }
    out.set("fields", std::move(fields_json));

    JsonValue indexes_json = JsonValue::array();
    for (const auto& i : indexes) {
        JsonValue ij = JsonValue::object();
        ij.set("name", i.name);
        ij.set("columns", string_array(i.columns));
        ij.set("unique", i.unique);
        indexes_json.push_back(std::move(ij));
    }
    out.set("indexes", std::move(indexes_json));

    JsonValue constraints_json = JsonValue::array();
    for (const auto& c : constraints) {
        JsonValue cj = JsonValue::object();
        cj.set("type", std::string(constraint_kind_to_string(c.kind)));
        cj.set("name", c.name);
        cj.set("columns", string_array(c.columns));
        if (c.kind == ConstraintKind::FOREIGN_KEY) {
            JsonValue refs = JsonValue::object();
            refs.set("table", c.references_table);
            refs.set("columns", string_array(c.references_columns));
            cj.set("references", std::move(refs));
            if (!c.on_delete.empty()) cj.set("onDelete", c.on_delete);
        }
        constraints_json.push_back(std::move(cj));
    }
    out.set("constraints", std::move(constraints_json));
    return out;
}

} // namespace polystore
