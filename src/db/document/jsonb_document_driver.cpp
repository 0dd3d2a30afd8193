#include "db/document/jsonb_document_driver.hpp"
#include "core/utils.hpp"
#include "db/document/document_pipeline.hpp"
#include "db/pooled_connection.hpp"
#include "query/sql_compiler.hpp"

#include <format>

namespace polystore {

namespace {

// undefined_table: reads from a collection that was never created
constexpr std::string_view UNDEFINED_TABLE = "42P01";

Status invalid_collection(const std::string& collection) {
    return Status::error(ErrorCategory::VALIDATION_ERROR,
        std::format("invalid collection name '{}'", collection));
}

bool valid_collection(const std::string& collection) {
    return collection.find('.') == std::string::npos &&
           SqlCompiler::is_valid_identifier(collection);
}

std::string pg_placeholder(const std::vector<SqlParam>& params) {
    return std::format("${}", params.size());
}

} // namespace

JsonbDocumentDriver::JsonbDocumentDriver(std::shared_ptr<IConnectionPool> pool,
                                         std::chrono::milliseconds acquire_timeout)
    : pool_(std::move(pool)), acquire_timeout_(acquire_timeout) {}

std::string JsonbDocumentDriver::path_expression(const std::string& field) {
    return std::format("doc #> '{{{}}}'", utils::join(utils::split(field, '.'), ","));
}

std::string JsonbDocumentDriver::filter_clause(const JsonValue& filter,
                                               std::vector<SqlParam>& params) {
    std::vector<std::string> terms;
    for (const auto& [key, value] : filter.items()) {
        // Path travels as a text[] parameter; "a.b" addresses doc->'a'->'b'
        params.push_back(std::format("{{{}}}", utils::join(utils::split(key, '.'), ",")));
        const auto path = std::format("(doc #> {}::text[])", pg_placeholder(params));
        if (value.is_null()) {
            terms.push_back(std::format("({0} IS NULL OR {0} = 'null'::jsonb)", path));
            continue;
        }
        params.push_back(value.dump());
        terms.push_back(std::format("{} = {}::jsonb", path, pg_placeholder(params)));
    }
    return terms.empty() ? std::string("TRUE") : utils::join(terms, " AND ");
}

Result<DbResultSet> JsonbDocumentDriver::query(const std::string& sql,
                                               const std::vector<SqlParam>& params) {
    using R = Result<DbResultSet>;
    if (closed_.load()) {
        return R::error(ErrorCategory::NO_CONNECTION, "jsonb driver is closed");
    }
    auto conn = pool_->acquire(acquire_timeout_);
    if (!conn) {
        return R::error(ErrorCategory::NO_CONNECTION,
            std::format("no connection available within {}ms", acquire_timeout_.count()));
    }

    utils::log::debug(std::format("[{}] {}", pool_->name(), sql));
    auto rs = (*conn)->execute_params(sql, params);
    if (!rs.success) {
        if (!(*conn)->is_connected()) conn->mark_broken();
        return R::error(rs.constraint_violation ? ErrorCategory::VALIDATION_ERROR
                                                : ErrorCategory::DRIVER_ERROR,
                        rs.error_code.empty() ? rs.error_message
                                              : std::format("[{}] {}", rs.error_code, rs.error_message));
    }
    return R::ok(std::move(rs));
}

Result<std::vector<JsonValue>> JsonbDocumentDriver::documents(const DbResultSet& rs) {
    using R = Result<std::vector<JsonValue>>;
    std::vector<JsonValue> out;
    out.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (row.empty() || !row.front()) continue;
        try {
            out.push_back(JsonValue::parse(*row.front()));
        } catch (const JsonValue::parse_error& e) {
            return R::error(ErrorCategory::DRIVER_ERROR,
                std::format("stored document is not valid JSON: {}", e.what()));
        }
    }
    return R::ok(std::move(out));
}

Status JsonbDocumentDriver::ping() {
    if (closed_.load()) {
        return Status::error(ErrorCategory::CONNECTION_ERROR, "jsonb driver is closed");
    }
    auto conn = pool_->acquire(acquire_timeout_);
    if (!conn) {
        return Status::error(ErrorCategory::CONNECTION_ERROR, "no connection available");
    }
    if (!(*conn)->is_healthy("SELECT 1")) {
        conn->mark_broken();
        return Status::error(ErrorCategory::CONNECTION_ERROR, "health check failed");
    }
    return Status::ok();
}

Status JsonbDocumentDriver::ensure_collection(const std::string& collection) {
    if (!valid_collection(collection)) return invalid_collection(collection);
    auto rs = query(std::format(
        "CREATE TABLE IF NOT EXISTS {} (id TEXT PRIMARY KEY, doc JSONB NOT NULL)", collection), {});
    if (rs.is_error()) return Status::propagate(rs);
    return Status::ok();
}

void JsonbDocumentDriver::close() {
    if (closed_.exchange(true)) return;
    pool_->drain();
}

Result<DocumentResult> JsonbDocumentDriver::run(const DocumentOperation& op) {
    using R = Result<DocumentResult>;
    if (!valid_collection(op.collection)) return R::propagate(invalid_collection(op.collection));

    const auto& table = op.collection;
    std::vector<SqlParam> params;
    DocumentResult result;

    auto finish = [&](const Result<DbResultSet>& rs, bool read) -> R {
        if (rs.is_error()) {
            // reads from a never-created collection see no documents
            if (read && rs.error_message().find(UNDEFINED_TABLE) != std::string::npos) {
                return R::ok(DocumentResult{});
            }
            return R::propagate(rs);
        }
        auto docs = documents(rs.value());
        if (docs.is_error()) return R::propagate(docs);
        result.documents = std::move(docs.value());
        result.affected = read ? result.documents.size() : rs.value().affected_rows;
        return R::ok(std::move(result));
    };

    switch (op.action) {
        case DocumentAction::FIND:
        case DocumentAction::FIND_ONE: {
            std::string sql = std::format("SELECT doc FROM {} WHERE {}",
                table, filter_clause(op.query, params));
            if (!op.options.sort.empty()) {
                std::vector<std::string> parts;
                for (const auto& o : op.options.sort) {
                    parts.push_back(path_expression(o.column) + (o.descending ? " DESC" : " ASC"));
                }
                sql += " ORDER BY " + utils::join(parts, ", ");
            }
            if (op.options.limit) sql += std::format(" LIMIT {}", *op.options.limit);
            if (op.options.skip) sql += std::format(" OFFSET {}", *op.options.skip);

            auto out = finish(query(sql, params), true);
            if (out.is_ok() && !op.options.projection.empty()) {
                for (auto& doc : out.value().documents) {
                    doc = DocumentPipeline::project(doc, op.options.projection);
                }
            }
            return out;
        }

        case DocumentAction::AGGREGATE: {
            const auto sql = std::format("SELECT doc FROM {} WHERE {} ORDER BY id",
                table, filter_clause(DocumentPipeline::leading_match(op.pipeline), params));
            auto fetched = finish(query(sql, params), true);
            if (fetched.is_error()) return fetched;
            auto out = DocumentPipeline::run(std::move(fetched.value().documents), op.pipeline);
            if (out.is_error()) return R::propagate(out);
            DocumentResult agg;
            agg.documents = DocumentPipeline::apply_options(std::move(out.value()), op.options);
            agg.affected = agg.documents.size();
            return R::ok(std::move(agg));
        }

        case DocumentAction::INSERT_ONE:
        case DocumentAction::INSERT_MANY: {
            std::vector<JsonValue> incoming = op.data.is_array()
                ? op.data.elements() : std::vector<JsonValue>{op.data};
            std::vector<std::string> tuples;
            for (auto& doc : incoming) {
                if (!doc.contains("id") || doc["id"].is_null()) {
                    doc.set("id", utils::generate_uuid());
                }
                params.push_back(doc["id"].to_text());
                const auto id_ph = pg_placeholder(params);
                params.push_back(doc.dump());
                tuples.push_back(std::format("({}, {}::jsonb)", id_ph, pg_placeholder(params)));
            }
            const auto sql = std::format("INSERT INTO {} (id, doc) VALUES {} RETURNING doc",
                table, utils::join(tuples, ", "));
            return finish(query(sql, params), false);
        }

        case DocumentAction::UPDATE_ONE:
        case DocumentAction::UPDATE_MANY: {
            params.push_back(op.data.dump());
            const auto filter = filter_clause(op.query, params);
            const auto sql = op.action == DocumentAction::UPDATE_ONE
                ? std::format("UPDATE {0} SET doc = doc || $1::jsonb WHERE id = "
                              "(SELECT id FROM {0} WHERE {1} ORDER BY id LIMIT 1) RETURNING doc",
                              table, filter)
                : std::format("UPDATE {} SET doc = doc || $1::jsonb WHERE {} RETURNING doc",
                              table, filter);
            return finish(query(sql, params), false);
        }

        case DocumentAction::DELETE_ONE:
        case DocumentAction::DELETE_MANY: {
            const auto filter = filter_clause(op.query, params);
            const auto sql = op.action == DocumentAction::DELETE_ONE
                ? std::format("DELETE FROM {0} WHERE id = "
                              "(SELECT id FROM {0} WHERE {1} ORDER BY id LIMIT 1) RETURNING doc",
                              table, filter)
                : std::format("DELETE FROM {} WHERE {} RETURNING doc", table, filter);
            return finish(query(sql, params), false);
        }
    }

    return R::error(ErrorCategory::UNSUPPORTED_OPERATION,
        std::format("document action '{}' is not supported", document_action_to_string(op.action)));
}

} // namespace polystore
