#pragma once

#include "api/http_constants.hpp"
#include "cache/query_cache.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/json.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace polystore {

class ConnectionRegistry;
class SchemaManager;
class ChangeNotifier;

/**
 * @brief Collaborators shared by every generated handler
 *
 * The referenced objects are owned by the engine and outlive the handlers.
 */
struct ApiContext {
    ConnectionRegistry& registry;
    SchemaManager& schemas;
    ChangeNotifier& notifier;
    std::shared_ptr<QueryCache> cache;      // nullptr = reads bypass the cache
    ApiConfig config;
    bool invalidate_on_write = false;
};

/// Transport-neutral request handed to a generated handler
struct ApiRequest {
    std::string id;                                 // ":id" path segment
    std::map<std::string, std::string> query;       // query-string parameters
    std::string body;
};

struct ApiResponse {
    int status = http::kOk;
    JsonValue body;                                 // null = empty body

    [[nodiscard]] bool has_body() const { return !body.is_null(); }
};

using RestHandler = std::function<ApiResponse(const ApiRequest&)>;

/// NotFound 404, Validation/Unsupported 400, NoConnection 503, otherwise 500
[[nodiscard]] inline int status_for_category(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NOT_FOUND: return http::kNotFound;
        case ErrorCategory::VALIDATION_ERROR:
        case ErrorCategory::UNSUPPORTED_OPERATION: return http::kBadRequest;
        case ErrorCategory::NO_CONNECTION: return http::kServiceUnavailable;
        default: return http::kInternalError;
    }
}

/// {"error":{"category":"NotFound","message":"..."}}
[[nodiscard]] inline JsonValue error_body(ErrorCategory category, const std::string& message) {
    JsonValue error = JsonValue::object();
    error.set("category", error_category_to_string(category));
    error.set("message", message);
    return JsonValue::wrap("error", std::move(error));
}

template<typename T>
[[nodiscard]] ApiResponse error_response(const Result<T>& result) {
    return {status_for_category(result.error_category()),
            error_body(result.error_category(), result.error_message())};
}

} // namespace polystore
