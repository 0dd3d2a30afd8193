#include "query/sql_compiler.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>

namespace polystore {

namespace {

bool is_ident_start(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

bool is_simple_identifier(std::string_view name) {
    if (name.empty() || !is_ident_start(name.front())) return false;
    for (char c : name) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

bool is_aggregate_call(std::string_view expr) {
    static constexpr std::array<std::string_view, 5> FUNCS = {"COUNT", "SUM", "AVG", "MIN", "MAX"};

    const auto open = expr.find('(');
    if (open == std::string_view::npos || expr.back() != ')') return false;

    const std::string fn = utils::to_lower(std::string(expr.substr(0, open)));
    bool known = false;
    for (const auto f : FUNCS) {
        if (utils::to_lower(std::string(f)) == fn) { known = true; break; }
    }
    if (!known) return false;

    const auto arg = expr.substr(open + 1, expr.size() - open - 2);
    return arg == "*" || SqlCompiler::is_valid_identifier(arg);
}

std::string join_list(const std::vector<std::string>& items) {
    return utils::join(items, ", ");
}

Result<CompiledStatement> invalid(std::string message) {
    return Result<CompiledStatement>::error(ErrorCategory::VALIDATION_ERROR, std::move(message));
}

} // namespace

// ============================================================================
// Validation
// ============================================================================

bool SqlCompiler::is_valid_identifier(std::string_view name) {
    if (name.empty()) return false;
    size_t start = 0;
    while (true) {
        const auto dot = name.find('.', start);
        const auto part = name.substr(start, dot == std::string_view::npos ? name.npos : dot - start);
        if (!is_simple_identifier(part)) return false;
        if (dot == std::string_view::npos) return true;
        start = dot + 1;
    }
}

bool SqlCompiler::is_valid_column_expression(std::string_view expr) {
    if (expr == "*") return true;

    // optional " AS alias" / " as alias"
    for (const std::string_view as : {" AS ", " as "}) {
        if (const auto pos = expr.find(as); pos != std::string_view::npos) {
            if (!is_simple_identifier(expr.substr(pos + as.size()))) return false;
            expr = expr.substr(0, pos);
            break;
        }
    }

    if (expr.size() > 2 && expr.ends_with(".*")) {
        return is_valid_identifier(expr.substr(0, expr.size() - 2));
    }
    return is_valid_identifier(expr) || is_aggregate_call(expr);
}

// ============================================================================
// Parameters
// ============================================================================

std::string SqlCompiler::placeholder(size_t index) const {
    if (dialect_ == SqlDialect::POSTGRESQL) {
        return std::format("${}", index);
    }
    return "?";
}

SqlParam SqlCompiler::to_param(const JsonValue& value) const {
    if (value.is_null()) return std::nullopt;
    if (value.is_boolean()) {
        const bool b = value.get<bool>();
        if (dialect_ == SqlDialect::MYSQL) return std::string(b ? "1" : "0");
        return std::string(b ? "true" : "false");
    }
    // strings unquoted, integers without fraction, objects/arrays as JSON text
    return value.to_text();
}

// ============================================================================
// Compilation
// ============================================================================

Result<CompiledStatement> SqlCompiler::compile(const QueryDescriptor& desc) const {
    if (desc.error) {
        return Result<CompiledStatement>::error(desc.error->first, desc.error->second);
    }
    if (!desc.pipeline.is_null()) {
        return Result<CompiledStatement>::error(ErrorCategory::UNSUPPORTED_OPERATION,
            "aggregate pipelines are only supported by document providers");
    }
    if (!is_valid_identifier(desc.collection)) {
        return invalid(std::format("invalid table name '{}'", desc.collection));
    }

    switch (desc.kind) {
        case OperationKind::SELECT: return compile_select(desc);
        case OperationKind::INSERT: return compile_insert(desc);
        case OperationKind::UPDATE: return compile_update(desc);
        case OperationKind::DELETE: return compile_delete(desc);
        default:
            return Result<CompiledStatement>::error(ErrorCategory::UNSUPPORTED_OPERATION,
                "operation kind must be set before execution");
    }
}

Status SqlCompiler::render_conjunction(const PredicateList& predicates, bool allow_aggregates,
                                       std::string& sql, std::vector<SqlParam>& params) const {
    bool first = true;
    for (const auto& [key, value] : predicates) {
        const bool valid = is_valid_identifier(key) || (allow_aggregates && is_aggregate_call(key));
        if (!valid) {
            return Status::error(ErrorCategory::VALIDATION_ERROR,
                std::format("invalid predicate column '{}'", key));
        }
        if (!first) sql += " AND ";
        first = false;

        if (value.is_null()) {
            sql += key + " IS NULL";
        } else {
            params.push_back(to_param(value));
            sql += std::format("{} = {}", key, placeholder(params.size()));
        }
    }
    return Status::ok();
}

Status SqlCompiler::render_returning(const QueryDescriptor& desc, std::string& sql) const {
    if (desc.returning.empty() || dialect_ != SqlDialect::POSTGRESQL) {
        return Status::ok();
    }
    for (const auto& col : desc.returning) {
        if (col != "*" && !is_valid_identifier(col)) {
            return Status::error(ErrorCategory::VALIDATION_ERROR,
                std::format("invalid returning column '{}'", col));
        }
    }
    sql += " RETURNING " + join_list(desc.returning);
    return Status::ok();
}

Result<CompiledStatement> SqlCompiler::compile_select(const QueryDescriptor& desc) const {
    CompiledStatement stmt;

    for (const auto& col : desc.columns) {
        if (!is_valid_column_expression(col)) {
            return invalid(std::format("invalid column '{}'", col));
        }
    }
    stmt.sql = std::format("SELECT {} FROM {}",
        desc.columns.empty() ? std::string("*") : join_list(desc.columns), desc.collection);

    for (const auto& join : desc.joins) {
        if (!is_valid_identifier(join.table) || !is_valid_identifier(join.left) ||
            !is_valid_identifier(join.right)) {
            return invalid(std::format("invalid join on '{}'", join.table));
        }
        stmt.sql += std::format(" {} {} ON {} = {}",
            join.type == JoinType::LEFT ? "LEFT JOIN" : "JOIN",
            join.table, join.left, join.right);
    }

    if (!desc.predicates.empty()) {
        stmt.sql += " WHERE ";
        const auto st = render_conjunction(desc.predicates, false, stmt.sql, stmt.params);
        if (st.is_error()) return Result<CompiledStatement>::propagate(st);
    }

    if (!desc.group_by.empty()) {
        for (const auto& g : desc.group_by) {
            if (!is_valid_identifier(g)) return invalid(std::format("invalid group column '{}'", g));
        }
        stmt.sql += " GROUP BY " + join_list(desc.group_by);
    }

    if (!desc.having.empty()) {
        stmt.sql += " HAVING ";
        const auto st = render_conjunction(desc.having, true, stmt.sql, stmt.params);
        if (st.is_error()) return Result<CompiledStatement>::propagate(st);
    }

    if (!desc.order.empty()) {
        std::vector<std::string> parts;
        parts.reserve(desc.order.size());
        for (const auto& o : desc.order) {
            if (!is_valid_identifier(o.column)) {
                return invalid(std::format("invalid order column '{}'", o.column));
            }
            parts.push_back(o.column + (o.descending ? " DESC" : " ASC"));
        }
        stmt.sql += " ORDER BY " + join_list(parts);
    }

    std::optional<int64_t> limit = desc.limit;
    if (desc.single) {
        limit = 1;
    }
    if (limit) {
        if (*limit < 0) return invalid("limit must be >= 0");
        stmt.sql += std::format(" LIMIT {}", *limit);
    }
    if (desc.offset) {
        if (*desc.offset < 0) return invalid("offset must be >= 0");
        stmt.sql += std::format(" OFFSET {}", *desc.offset);
    }

    return Result<CompiledStatement>::ok(std::move(stmt));
}

Result<CompiledStatement> SqlCompiler::compile_insert(const QueryDescriptor& desc) const {
    std::vector<JsonValue> rows;
    if (desc.data.is_array()) {
        rows = desc.data.elements();
    } else if (desc.data.is_object()) {
        rows.push_back(desc.data);
    }
    if (rows.empty() || rows.front().empty()) {
        return invalid("insert requires a non-empty payload");
    }

    const auto columns = rows.front().keys();
    for (const auto& col : columns) {
        if (!is_valid_identifier(col)) return invalid(std::format("invalid column '{}'", col));
    }

    CompiledStatement stmt;
    std::vector<std::string> tuples;
    tuples.reserve(rows.size());
    for (const auto& row : rows) {
        if (!row.is_object() || row.keys() != columns) {
            return invalid("every inserted row must have the same columns");
        }
        std::vector<std::string> placeholders;
        placeholders.reserve(columns.size());
        for (const auto& col : columns) {
            stmt.params.push_back(to_param(row[col]));
            placeholders.push_back(placeholder(stmt.params.size()));
        }
        tuples.push_back("(" + join_list(placeholders) + ")");
    }

    stmt.sql = std::format("INSERT INTO {} ({}) VALUES {}",
        desc.collection, join_list(columns), join_list(tuples));

    const auto st = render_returning(desc, stmt.sql);
    if (st.is_error()) return Result<CompiledStatement>::propagate(st);
    return Result<CompiledStatement>::ok(std::move(stmt));
}

Result<CompiledStatement> SqlCompiler::compile_update(const QueryDescriptor& desc) const {
    if (!desc.data.is_object() || desc.data.empty()) {
        return invalid("update requires a non-empty payload");
    }
    if (desc.predicates.empty()) {
        return invalid("update requires a where clause");
    }

    CompiledStatement stmt;
    std::vector<std::string> assignments;
    for (const auto& [col, value] : desc.data.items()) {
        if (!is_valid_identifier(col)) return invalid(std::format("invalid column '{}'", col));
        stmt.params.push_back(to_param(value));
        assignments.push_back(std::format("{} = {}", col, placeholder(stmt.params.size())));
    }
    stmt.sql = std::format("UPDATE {} SET {} WHERE ", desc.collection, join_list(assignments));

    // WHERE placeholders continue numbering after the SET clause
    const auto st = render_conjunction(desc.predicates, false, stmt.sql, stmt.params);
    if (st.is_error()) return Result<CompiledStatement>::propagate(st);

    const auto rt = render_returning(desc, stmt.sql);
    if (rt.is_error()) return Result<CompiledStatement>::propagate(rt);
    return Result<CompiledStatement>::ok(std::move(stmt));
}

Result<CompiledStatement> SqlCompiler::compile_delete(const QueryDescriptor& desc) const {
    if (desc.predicates.empty()) {
        return invalid("delete requires a where clause");
    }

    CompiledStatement stmt;
    stmt.sql = std::format("DELETE FROM {} WHERE ", desc.collection);
    const auto st = render_conjunction(desc.predicates, false, stmt.sql, stmt.params);
    if (st.is_error()) return Result<CompiledStatement>::propagate(st);

    const auto rt = render_returning(desc, stmt.sql);
    if (rt.is_error()) return Result<CompiledStatement>::propagate(rt);
    return Result<CompiledStatement>::ok(std::move(stmt));
}

Result<CompiledStatement> SqlCompiler::compile_lookup(
    const std::string& table,
    const std::vector<std::string>& columns,
    const PredicateList& predicates) const {

    QueryDescriptor desc;
    desc.kind = OperationKind::SELECT;
    desc.collection = table;
    for (const auto& c : columns) {
        if (c != "*") desc.columns.push_back(c);
    }
    desc.predicates = predicates;
    return compile(desc);
}

} // namespace polystore
