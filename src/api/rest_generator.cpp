#include "api/rest_generator.hpp"
#include "core/utils.hpp"
#include "schema/schema_manager.hpp"

#include <format>

namespace polystore {

namespace {

/// Body of a create/update request; must be a non-empty JSON object
Result<JsonValue> parse_body(const std::string& body) {
    using R = Result<JsonValue>;
    JsonValue parsed;
    try {
        parsed = JsonValue::parse(body);
    } catch (const JsonValue::parse_error&) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "request body is not valid JSON");
    }
    if (!parsed.is_object() || parsed.empty()) {
        return R::error(ErrorCategory::VALIDATION_ERROR, "request body must be a non-empty JSON object");
    }
    return R::ok(std::move(parsed));
}

/// page/limit from the query string; absent values take the defaults
Result<int64_t> parse_positive(const std::map<std::string, std::string>& query,
                               std::string_view name, int64_t fallback) {
    const auto it = query.find(std::string(name));
    if (it == query.end() || it->second.empty()) return Result<int64_t>::ok(fallback);
    const auto n = utils::try_parse_int<int64_t>(it->second);
    if (!n || *n < 1) {
        return Result<int64_t>::error(ErrorCategory::VALIDATION_ERROR,
            std::format("{} must be a positive integer, got '{}'", name, it->second));
    }
    return Result<int64_t>::ok(*n);
}

} // namespace

Result<std::vector<RestRoute>> RestGenerator::generate(const std::string& provider,
                                                       const SchemaDescriptor& schema) const {
    using R = Result<std::vector<RestRoute>>;

    if (!context_.schemas.find_schema(provider, schema.name)) {
        const auto registered = context_.schemas.register_schema(provider, schema);
        if (registered.is_error()) return R::propagate(registered);
    }

    auto service = std::make_shared<const EntityService>(context_, provider, schema);
    auto routes = routes_for(std::move(service));
    utils::log::info(std::format("Generated {} REST routes for '{}' on '{}'",
        routes.size(), schema.name, provider));
    return R::ok(std::move(routes));
}

std::vector<RestRoute> RestGenerator::routes_for(std::shared_ptr<const EntityService> service) const {
    const std::string collection = std::format("{}/{}", context_.config.base_path, service->entity());
    const std::string member = collection + "/:id";

    return {
        {"GET", collection, list_handler(service, context_.config)},
        {"GET", member, get_handler(service)},
        {"POST", collection, create_handler(service)},
        {"PUT", member, update_handler(service)},
        {"DELETE", member, delete_handler(service)},
    };
}

RestHandler RestGenerator::list_handler(std::shared_ptr<const EntityService> service,
                                        const ApiConfig& config) {
    return [service, default_limit = config.default_limit](const ApiRequest& req) -> ApiResponse {
        const auto page = parse_positive(req.query, http::kPageParam, 1);
        if (page.is_error()) return error_response(page);
        const auto limit = parse_positive(req.query, http::kLimitParam, default_limit);
        if (limit.is_error()) return error_response(limit);

        const auto filters = service->coerce_filters(req.query);
        if (filters.is_error()) return error_response(filters);

        const auto listed = service->list(page.value(), limit.value(), filters.value());
        if (listed.is_error()) return error_response(listed);
        return {http::kOk, listed.value().to_json()};
    };
}

RestHandler RestGenerator::get_handler(std::shared_ptr<const EntityService> service) {
    return [service](const ApiRequest& req) -> ApiResponse {
        const auto record = service->get(req.id);
        if (record.is_error()) return error_response(record);
        return {http::kOk, JsonValue::wrap("data", record.value())};
    };
}

RestHandler RestGenerator::create_handler(std::shared_ptr<const EntityService> service) {
    return [service](const ApiRequest& req) -> ApiResponse {
        const auto data = parse_body(req.body);
        if (data.is_error()) return error_response(data);

        const auto created = service->create(data.value());
        if (created.is_error()) return error_response(created);
        return {http::kCreated, JsonValue::wrap("data", created.value())};
    };
}

RestHandler RestGenerator::update_handler(std::shared_ptr<const EntityService> service) {
    return [service](const ApiRequest& req) -> ApiResponse {
        const auto data = parse_body(req.body);
        if (data.is_error()) return error_response(data);

        const auto updated = service->update(req.id, data.value());
        if (updated.is_error()) return error_response(updated);
        return {http::kOk, JsonValue::wrap("data", updated.value())};
    };
}

RestHandler RestGenerator::delete_handler(std::shared_ptr<const EntityService> service) {
    return [service](const ApiRequest& req) -> ApiResponse {
        const auto removed = service->remove(req.id);
        if (removed.is_error()) return error_response(removed);
        return {http::kNoContent, JsonValue{}};
    };
}

} // namespace polystore
