#include "api/entity_service.hpp"
#include "core/utils.hpp"
#include "db/connection_registry.hpp"
#include "schema/schema_manager.hpp"

#include <format>
#include <limits>

namespace polystore {

JsonValue ListPage::to_json() const {
    JsonValue data = JsonValue::array();
    for (const auto& item : items) data.push_back(item);

    JsonValue pagination = JsonValue::object();
    pagination.set("page", page);
    pagination.set("limit", limit);
    pagination.set("total", total);

    JsonValue body = JsonValue::object();
    body.set("data", std::move(data));
    body.set("pagination", std::move(pagination));
    return body;
}

EntityService::EntityService(ApiContext context, std::string provider, SchemaDescriptor schema)
    : context_(std::move(context)), provider_(std::move(provider)), schema_(std::move(schema)) {
    const auto pk = schema_.primary_key_columns();
    id_field_ = pk.size() == 1 ? pk.front() : std::string("id");
}

Result<QueryBuilder> EntityService::query() const {
    auto executor = context_.registry.executor(provider_);
    if (executor.is_error()) return Result<QueryBuilder>::propagate(executor);
    return Result<QueryBuilder>::ok(QueryBuilder(executor.value(), context_.cache));
}

// ============================================================================
// Parameter coercion
// ============================================================================

Result<JsonValue> EntityService::coerce(const std::string& field, const std::string& text) const {
    using R = Result<JsonValue>;
    const auto* descriptor = schema_.find_field(field);
    if (!descriptor) {
        return R::error(ErrorCategory::VALIDATION_ERROR,
            std::format("unknown field '{}' for '{}'", field, entity()));
    }

    switch (descriptor->type) {
        case SemanticType::INTEGER:
        case SemanticType::BIGINT: {
            const auto n = utils::try_parse_int<long long>(text);
            if (!n) {
                return R::error(ErrorCategory::VALIDATION_ERROR,
                    std::format("field '{}' expects an integer, got '{}'", field, text));
            }
            // Past 2^53 a double drops digits; bind the text instead
            constexpr auto kExact = static_cast<long long>(JsonValue::kMaxExactInteger);
            if (*n > kExact || *n < -kExact) {
                return R::ok(JsonValue(text));
            }
            return R::ok(JsonValue(*n));
        }
        case SemanticType::FLOAT:
        case SemanticType::DOUBLE: {
            const auto d = utils::try_parse_double(text);
            if (!d) {
                return R::error(ErrorCategory::VALIDATION_ERROR,
                    std::format("field '{}' expects a number, got '{}'", field, text));
            }
            return R::ok(JsonValue(*d));
        }
        case SemanticType::BOOLEAN: {
            const auto lower = utils::to_lower(text);
            if (lower == "true" || lower == "1") return R::ok(JsonValue(true));
            if (lower == "false" || lower == "0") return R::ok(JsonValue(false));
            return R::error(ErrorCategory::VALIDATION_ERROR,
                std::format("field '{}' expects a boolean, got '{}'", field, text));
        }
        case SemanticType::UUID:
            if (!utils::is_uuid(text)) {
                return R::error(ErrorCategory::VALIDATION_ERROR,
                    std::format("field '{}' expects a uuid, got '{}'", field, text));
            }
            return R::ok(JsonValue(text));
        default:
            return R::ok(JsonValue(text));
    }
}

Result<JsonValue> EntityService::coerce_filters(const std::map<std::string, std::string>& params) const {
    JsonValue filters = JsonValue::object();
    for (const auto& [key, text] : params) {
        if (key == http::kPageParam || key == http::kLimitParam) continue;
        auto value = coerce(key, text);
        if (value.is_error()) return value;
        filters.set(key, value.value());
    }
    return Result<JsonValue>::ok(std::move(filters));
}

Result<JsonValue> EntityService::id_value(const std::string& id) const {
    if (id.empty()) {
        return Result<JsonValue>::error(ErrorCategory::VALIDATION_ERROR, "id must not be empty");
    }
    if (!schema_.find_field(id_field_)) {
        // Schemaless id: document stores generate text ids
        return Result<JsonValue>::ok(JsonValue(id));
    }
    auto key = coerce(id_field_, id);
    if (key.is_error()) {
        // No row can carry an id of the wrong shape
        return Result<JsonValue>::error(ErrorCategory::NOT_FOUND,
            std::format("{} '{}' not found", entity(), id));
    }
    return key;
}

// ============================================================================
// Reads
// ============================================================================

Result<int64_t> EntityService::count(const QueryBuilder& builder, const JsonValue& filters) const {
    using R = Result<int64_t>;

    auto executor = context_.registry.executor(provider_);
    if (executor.is_error()) return R::propagate(executor);

    const auto counted = [&] {
        if (executor.value()->family() == ProviderFamily::DOCUMENT) {
            JsonValue pipeline = JsonValue::array();
            pipeline.push_back(JsonValue::wrap("$match", filters));
            pipeline.push_back(JsonValue::wrap("$count", "total"));
            return builder.aggregate(std::move(pipeline)).from(entity()).execute();
        }
        return builder.select({"COUNT(*) AS total"}).from(entity()).where(filters).execute();
    }();
    if (counted.is_error()) return R::propagate(counted);

    // $count over no documents yields no row
    const auto total = counted.value().record()["total"];
    if (total.is_number()) return R::ok(total.get<int64_t>());
    if (total.is_string()) return R::ok(utils::parse_int<int64_t>(total.get<std::string>()));
    return R::ok(0);
}

Result<ListPage> EntityService::list(int64_t page, int64_t limit, const JsonValue& filters) const {
    using R = Result<ListPage>;

    if (page < 1) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "page must be >= 1");
    }
    if (limit < 1 || limit > context_.config.max_limit) {
        return R::error(ErrorCategory::VALIDATION_ERROR,
            std::format("limit must be between 1 and {}", context_.config.max_limit));
    }
    if (page - 1 > std::numeric_limits<int64_t>::max() / limit) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "page is out of range");
    }
    for (const auto& key : filters.keys()) {
        if (!schema_.find_field(key)) {
            return R::error(ErrorCategory::VALIDATION_ERROR,
                std::format("unknown filter '{}' for '{}'", key, entity()));
        }
    }

    auto builder = query();
    if (builder.is_error()) return R::propagate(builder);
    const bool use_cache = context_.cache && context_.cache->is_enabled();

    auto rows = builder.value().select().from(entity()).where(filters)
        .order_by(id_field_).limit(limit).offset((page - 1) * limit)
        .cached(use_cache).execute();
    if (rows.is_error()) return R::propagate(rows);

    auto total = count(builder.value().cached(use_cache), filters);
    if (total.is_error()) return R::propagate(total);

    ListPage result;
    result.items = std::move(rows.value().rows);
    result.page = page;
    result.limit = limit;
    result.total = total.value();
    return R::ok(std::move(result));
}

Result<JsonValue> EntityService::get(const std::string& id) const {
    using R = Result<JsonValue>;

    auto key = id_value(id);
    if (key.is_error()) return key;
    auto builder = query();
    if (builder.is_error()) return R::propagate(builder);

    auto found = builder.value().select().from(entity()).where(id_field_, key.value())
        .first().cached(context_.cache && context_.cache->is_enabled()).execute();
    if (found.is_error()) return R::propagate(found);

    auto record = found.value().record();
    if (record.is_null()) {
        return R::error(ErrorCategory::NOT_FOUND, std::format("{} '{}' not found", entity(), id));
    }
    return R::ok(std::move(record));
}

// ============================================================================
// Writes
// ============================================================================

void EntityService::after_write(LifecycleEvent event, const JsonValue& payload) const {
    if (context_.invalidate_on_write && context_.cache) {
        context_.cache->invalidate_collection(provider_, entity());
    }
    const auto published = context_.notifier.publish(entity(), event, payload);
    if (published.is_error()) {
        utils::log::warn(std::format("Publish for {} failed: {}", entity(), published.error_message()));
    }
}

Result<JsonValue> EntityService::create(const JsonValue& data) const {
    using R = Result<JsonValue>;

    const auto valid = context_.schemas.validate_record(provider_, entity(), data, false);
    if (valid.is_error()) return R::propagate(valid);
    auto builder = query();
    if (builder.is_error()) return R::propagate(builder);

    auto inserted = builder.value().insert_into(entity(), data).returning().first().execute();
    if (inserted.is_error()) return R::propagate(inserted);

    auto record = inserted.value().record();
    if (record.is_null()) record = data;
    after_write(LifecycleEvent::CREATED, record);
    return R::ok(std::move(record));
}

Result<JsonValue> EntityService::update(const std::string& id, const JsonValue& data) const {
    using R = Result<JsonValue>;

    auto key = id_value(id);
    if (key.is_error()) return key;
    const auto valid = context_.schemas.validate_record(provider_, entity(), data, true);
    if (valid.is_error()) return R::propagate(valid);
    auto builder = query();
    if (builder.is_error()) return R::propagate(builder);

    auto updated = builder.value().update(data).table(entity()).where(id_field_, key.value())
        .returning().first().execute();
    if (updated.is_error()) return R::propagate(updated);

    auto record = updated.value().record();
    if (record.is_null()) {
        return R::error(ErrorCategory::NOT_FOUND, std::format("{} '{}' not found", entity(), id));
    }
    after_write(LifecycleEvent::UPDATED, record);
    return R::ok(std::move(record));
}

Status EntityService::remove(const std::string& id) const {
    auto key = id_value(id);
    if (key.is_error()) return Status::propagate(key);
    auto builder = query();
    if (builder.is_error()) return Status::propagate(builder);

    auto removed = builder.value().remove().from(entity()).where(id_field_, key.value())
        .returning().first().execute();
    if (removed.is_error()) return Status::propagate(removed);

    if (removed.value().record().is_null() && removed.value().affected_rows == 0) {
        return Status::error(ErrorCategory::NOT_FOUND, std::format("{} '{}' not found", entity(), id));
    }
    after_write(LifecycleEvent::DELETED, JsonValue::wrap(id_field_, key.value()));
    return Status::ok();
}

} // namespace polystore
