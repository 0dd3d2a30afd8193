#include "db/relational_executor.hpp"
#include "core/utils.hpp"

#include <format>

namespace polystore {

namespace {

SqlDialect dialect_for(ProviderKind kind) {
    return kind == ProviderKind::MYSQL ? SqlDialect::MYSQL : SqlDialect::POSTGRESQL;
}

JsonValue decode_cell(const std::string& text, CellDecoding decoding) {
    switch (decoding) {
        case CellDecoding::INTEGER: {
            // BIGINTs past 2^53 would lose digits as a double
            constexpr auto kExact = static_cast<long long>(JsonValue::kMaxExactInteger);
            const auto v = utils::try_parse_int<long long>(text);
            if (v && *v <= kExact && *v >= -kExact) return JsonValue(*v);
            return JsonValue(text);
        }
        case CellDecoding::FLOAT:
            if (const auto v = utils::try_parse_double(text)) return JsonValue(*v);
            return JsonValue(text);
        case CellDecoding::BOOLEAN:
            return JsonValue(text == "t" || text == "true" || text == "1");
        case CellDecoding::JSON:
            try {
                return JsonValue::parse(text);
            } catch (const JsonValue::parse_error&) {
                return JsonValue(text);
            }
        default:
            return JsonValue(text);
    }
}

} // namespace

std::vector<JsonValue> decode_result_rows(const DbResultSet& rs) {
    std::vector<CellDecoding> decodings;
    decodings.reserve(rs.column_names.size());
    for (size_t i = 0; i < rs.column_names.size(); ++i) {
        decodings.push_back(i < rs.column_types.size()
            ? cell_decoding(rs.column_types[i].generic_type)
            : CellDecoding::TEXT);
    }

    std::vector<JsonValue> out;
    out.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        JsonValue record = JsonValue::object();
        for (size_t i = 0; i < rs.column_names.size() && i < row.size(); ++i) {
            record.set(rs.column_names[i],
                row[i] ? decode_cell(*row[i], decodings[i]) : JsonValue{});
        }
        out.push_back(std::move(record));
    }
    return out;
}

// ============================================================================
// RelationalExecutor
// ============================================================================

RelationalExecutor::RelationalExecutor(std::string name, ProviderKind kind,
                                       std::shared_ptr<IConnectionPool> pool,
                                       std::chrono::milliseconds acquire_timeout)
    : name_(std::move(name)),
      kind_(kind),
      pool_(std::move(pool)),
      acquire_timeout_(acquire_timeout),
      compiler_(dialect_for(kind)),
      ddl_(dialect_for(kind)) {}

RelationalExecutor::~RelationalExecutor() {
    if (!closed_.load()) {
        (void)close();
    }
}

Result<std::unique_ptr<PooledConnection>> RelationalExecutor::borrow() {
    using R = Result<std::unique_ptr<PooledConnection>>;
    if (closed_.load()) {
        return R::error(ErrorCategory::NO_CONNECTION, std::format("provider '{}' is closed", name_));
    }
    auto conn = pool_->acquire(acquire_timeout_);
    if (!conn) {
        return R::error(ErrorCategory::NO_CONNECTION,
            std::format("provider '{}': no connection available within {}ms",
                name_, acquire_timeout_.count()));
    }
    return R::ok(std::move(conn));
}

Result<DbResultSet> RelationalExecutor::run(PooledConnection& conn, const CompiledStatement& stmt,
                                            std::string_view operation) {
    utils::log::debug(std::format("[{}] {} ({} params)", name_, stmt.sql, stmt.params.size()));

    auto rs = conn->execute_params(stmt.sql, stmt.params);
    if (!rs.success) {
        if (!conn->is_connected()) {
            conn.mark_broken();
        }
        return Result<DbResultSet>::propagate(
            wrap_driver_failure(name_, operation, rs.error_message, rs.constraint_violation));
    }
    return Result<DbResultSet>::ok(std::move(rs));
}

Result<QueryOutput> RelationalExecutor::execute(const QueryDescriptor& desc) {
    utils::Timer timer;

    // Validate before borrowing a connection
    auto compiled = compiler_.compile(desc);
    if (compiled.is_error()) {
        return Result<QueryOutput>::propagate(compiled);
    }

    auto conn = borrow();
    if (conn.is_error()) {
        return Result<QueryOutput>::propagate(conn);
    }

    Result<QueryOutput> result = Result<QueryOutput>::error(ErrorCategory::INTERNAL_ERROR, "");
    if (kind_ == ProviderKind::MYSQL && is_write(desc.kind) && !desc.returning.empty()) {
        result = execute_with_readback(*conn.value(), desc);
    } else {
        auto rs = run(*conn.value(), compiled.value(), operation_kind_to_string(desc.kind));
        if (rs.is_error()) {
            return Result<QueryOutput>::propagate(rs);
        }
        QueryOutput out;
        out.rows = decode_result_rows(rs.value());
        out.affected_rows = desc.kind == OperationKind::SELECT
            ? out.rows.size() : rs.value().affected_rows;
        result = Result<QueryOutput>::ok(std::move(out));
    }

    if (result.is_error()) {
        return result;
    }
    auto& out = result.value();
    out.single = desc.single;
    if (desc.single && out.rows.size() > 1) {
        out.rows.resize(1);
    }
    out.execution_time = timer.elapsed_us();
    return result;
}

Result<QueryOutput> RelationalExecutor::execute_with_readback(PooledConnection& conn,
                                                              QueryDescriptor desc) {
    using R = Result<QueryOutput>;
    const std::string op(operation_kind_to_string(desc.kind));
    const auto keys = table_keys(desc.collection);

    auto lookup = [&](const std::vector<std::string>& columns,
                      const PredicateList& preds) -> Result<std::vector<JsonValue>> {
        auto stmt = compiler_.compile_lookup(desc.collection, columns, preds);
        if (stmt.is_error()) return Result<std::vector<JsonValue>>::propagate(stmt);
        auto rs = run(conn, stmt.value(), op);
        if (rs.is_error()) return Result<std::vector<JsonValue>>::propagate(rs);
        return Result<std::vector<JsonValue>>::ok(decode_result_rows(rs.value()));
    };

    auto plain = [&](const std::string& sql) -> Status {
        auto rs = conn->execute(sql);
        if (!rs.success) return wrap_driver_failure(name_, op, rs.error_message);
        return Status::ok();
    };

    auto rollback = [&]() {
        const auto st = plain("ROLLBACK");
        if (st.is_error()) {
            conn.mark_broken();
            utils::log::warn(std::format("[{}] {}", name_, st.error_message()));
        }
    };

    QueryOutput out;

    if (desc.kind == OperationKind::INSERT) {
        std::vector<JsonValue> rows = desc.data.is_array()
            ? desc.data.elements() : std::vector<JsonValue>{desc.data};

        // Client-side uuid keys, so the row can be found again
        if (keys && !keys->uuid_key.empty()) {
            JsonValue filled = JsonValue::array();
            for (auto& row : rows) {
                if (!row.contains(keys->uuid_key)) row.set(keys->uuid_key, utils::generate_uuid());
                filled.push_back(row);
            }
            desc.data = desc.data.is_array() ? filled : rows.front();
        }

        auto stmt = compiler_.compile(desc);
        if (stmt.is_error()) return R::propagate(stmt);
        auto rs = run(conn, stmt.value(), op);
        if (rs.is_error()) return R::propagate(rs);
        out.affected_rows = rs.value().affected_rows;

        for (size_t i = 0; i < rows.size(); ++i) {
            const auto& row = rows[i];
            PredicateList preds;
            if (keys && !keys->auto_increment.empty() && !row.contains(keys->auto_increment) &&
                rs.value().last_insert_id > 0) {
                preds.emplace_back(keys->auto_increment,
                    JsonValue(static_cast<unsigned long>(rs.value().last_insert_id + i)));
            } else if (keys && !keys->primary_key.empty()) {
                for (const auto& col : keys->primary_key) {
                    if (row.contains(col)) preds.emplace_back(col, row[col]);
                }
                if (preds.size() != keys->primary_key.size()) preds.clear();
            }
            if (preds.empty()) {
                for (const auto& [col, value] : row.items()) preds.emplace_back(col, value);
            }

            auto found = lookup(desc.returning, preds);
            if (found.is_error()) return R::propagate(found);
            if (!found.value().empty()) out.rows.push_back(found.value().front());
        }
        return R::ok(std::move(out));
    }

    auto stmt = compiler_.compile(desc);
    if (stmt.is_error()) return R::propagate(stmt);

    const auto begin = plain("START TRANSACTION");
    if (begin.is_error()) return R::propagate(begin);

    if (desc.kind == OperationKind::DELETE) {
        auto before = lookup(desc.returning, desc.predicates);
        if (before.is_error()) { rollback(); return R::propagate(before); }

        auto rs = run(conn, stmt.value(), op);
        if (rs.is_error()) { rollback(); return R::propagate(rs); }

        out.rows = std::move(before.value());
        out.affected_rows = rs.value().affected_rows;
    } else {
        // UPDATE: locate the affected keys first when the table layout is known
        std::vector<PredicateList> targets;
        if (keys && !keys->primary_key.empty()) {
            auto ids = lookup(keys->primary_key, desc.predicates);
            if (ids.is_error()) { rollback(); return R::propagate(ids); }
            for (const auto& id : ids.value()) {
                PredicateList preds;
                for (const auto& col : keys->primary_key) {
                    preds.emplace_back(col, desc.data.contains(col) ? desc.data[col] : id[col]);
                }
                targets.push_back(std::move(preds));
            }
        } else {
            PredicateList preds;
            for (const auto& [col, value] : desc.predicates) {
                preds.emplace_back(col, desc.data.contains(col) ? desc.data[col] : value);
            }
            targets.push_back(std::move(preds));
        }

        auto rs = run(conn, stmt.value(), op);
        if (rs.is_error()) { rollback(); return R::propagate(rs); }
        out.affected_rows = rs.value().affected_rows;

        for (const auto& preds : targets) {
            auto found = lookup(desc.returning, preds);
            if (found.is_error()) { rollback(); return R::propagate(found); }
            for (auto& row : found.value()) out.rows.push_back(std::move(row));
        }
    }

    const auto commit = plain("COMMIT");
    if (commit.is_error()) {
        rollback();
        return R::propagate(commit);
    }
    return R::ok(std::move(out));
}

Result<SchemaApplyResult> RelationalExecutor::ensure_schema(const SchemaDescriptor& schema) {
    using R = Result<SchemaApplyResult>;

    auto ddl = ddl_.build(schema);
    if (ddl.is_error()) return R::propagate(ddl);

    auto conn = borrow();
    if (conn.is_error()) return R::propagate(conn);

    SchemaApplyResult result;
    result.table = schema.name;

    for (const auto& stmt : ddl.value()) {
        utils::log::debug(std::format("[{}] {}", name_, stmt.sql));
        auto rs = (*conn.value())->execute(stmt.sql);
        if (!rs.success) {
            // 1061: duplicate key name, i.e. the index already exists
            if (kind_ == ProviderKind::MYSQL && stmt.is_index && rs.error_code == "1061") {
                continue;
            }
            return R::propagate(wrap_driver_failure(name_, "create_schema", rs.error_message));
        }
        result.statements.push_back(stmt.sql);
    }

    TableKeys keys;
    keys.primary_key = schema.primary_key_columns();
    for (const auto& field : schema.fields) {
        if (field.auto_increment) keys.auto_increment = field.name;
    }
    if (keys.primary_key.size() == 1) {
        const auto* pk = schema.find_field(keys.primary_key.front());
        if (pk && pk->type == SemanticType::UUID && !pk->default_value) {
            keys.uuid_key = pk->name;
        }
    }
    {
        std::lock_guard<std::mutex> lock(keys_mutex_);
        table_keys_[schema.name] = std::move(keys);
    }

    result.created = true;
    return R::ok(std::move(result));
}

std::optional<RelationalExecutor::TableKeys> RelationalExecutor::table_keys(
    const std::string& table) const {
    std::lock_guard<std::mutex> lock(keys_mutex_);
    const auto it = table_keys_.find(table);
    if (it == table_keys_.end()) return std::nullopt;
    return it->second;
}

Status RelationalExecutor::ping() {
    auto conn = borrow();
    if (conn.is_error()) return Status::propagate(conn);
    if (!(*conn.value())->is_healthy("SELECT 1")) {
        conn.value()->mark_broken();
        return Status::error(ErrorCategory::CONNECTION_ERROR,
            std::format("provider '{}' failed its health check", name_));
    }
    return Status::ok();
}

Status RelationalExecutor::close() {
    if (closed_.exchange(true)) {
        return Status::ok();
    }
    pool_->drain();
    utils::log::info(std::format("Provider '{}' closed", name_));
    return Status::ok();
}

} // namespace polystore
