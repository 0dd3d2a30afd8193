#include "api/http_server.hpp"
#include "api/http_constants.hpp"
#include "core/utils.hpp"
#include "db/connection_registry.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace polystore {

HttpServer::HttpServer(const ServerConfig& config, ConnectionRegistry& registry)
    : config_(config), registry_(registry) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::add_routes(std::vector<RestRoute> routes) {
    std::lock_guard lock(mutex_);
    for (auto& route : routes) routes_.push_back(std::move(route));
}

void HttpServer::set_graphql(std::shared_ptr<GraphQLHandler> handler) {
    std::lock_guard lock(mutex_);
    graphql_ = std::move(handler);
}

size_t HttpServer::route_count() const {
    std::lock_guard lock(mutex_);
    return routes_.size();
}

// ============================================================================
// Request/response translation
// ============================================================================

ApiRequest HttpServer::to_api_request(const httplib::Request& req) {
    ApiRequest request;
    if (const auto it = req.path_params.find("id"); it != req.path_params.end()) {
        request.id = it->second;
    }
    // Repeated query keys: first value wins
    for (const auto& [key, value] : req.params) {
        request.query.emplace(key, value);
    }
    request.body = req.body;
    return request;
}

void HttpServer::write_response(const ApiResponse& response, httplib::Response& res) {
    res.status = response.status;
    if (response.has_body()) {
        res.set_content(response.body.dump(), http::kJsonContentType);
    }
}

// ============================================================================
// start(): creates the server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    httplib::Server* svr = nullptr;
    {
        std::lock_guard lock(mutex_);
        server_ = std::make_unique<httplib::Server>();
        svr = server_.get();
    }

    const size_t pool_size = config_.thread_pool_size;
    svr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    svr->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    register_rest_routes(*svr);
    register_graphql_routes(*svr);

    utils::log::info(std::format("Starting polystore HTTP server on {}:{} ({} threads, {} REST routes)",
        config_.host, config_.port, config_.thread_pool_size, route_count()));

    if (!svr->listen(config_.host, config_.port)) {
        throw std::runtime_error(std::format("Failed to start HTTP server on {}:{}",
            config_.host, config_.port));
    }
}

void HttpServer::stop() {
    std::lock_guard lock(mutex_);
    if (server_ && server_->is_running()) {
        server_->stop();
        utils::log::info("HTTP server stopped");
    }
}

bool HttpServer::is_running() const {
    std::lock_guard lock(mutex_);
    return server_ && server_->is_running();
}

// ============================================================================
// Route registration groups
// ============================================================================

void HttpServer::register_rest_routes(httplib::Server& svr) {
    std::lock_guard lock(mutex_);
    for (const auto& route : routes_) {
        auto handler = [h = route.handler](const httplib::Request& req, httplib::Response& res) {
            write_response(h(to_api_request(req)), res);
        };

        if (route.method == "GET") svr.Get(route.path, handler);
        else if (route.method == "POST") svr.Post(route.path, handler);
        else if (route.method == "PUT") svr.Put(route.path, handler);
        else if (route.method == "DELETE") svr.Delete(route.path, handler);
        else utils::log::warn(std::format("Skipping route with unknown method {} {}",
            route.method, route.path));
    }
}

void HttpServer::register_graphql_routes(httplib::Server& svr) {
    std::shared_ptr<GraphQLHandler> graphql;
    {
        std::lock_guard lock(mutex_);
        graphql = graphql_;
    }
    if (!graphql || !graphql->config().enabled) return;

    const auto& endpoint = graphql->config().endpoint;
    svr.Post(endpoint, [this](const httplib::Request& req, httplib::Response& res) {
        handle_graphql(req, res);
    });
    svr.Get(endpoint + "/schema", [graphql](const httplib::Request&, httplib::Response& res) {
        res.set_content(graphql->sdl(), "text/plain");
    });
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    const auto available = registry_.available_providers();
    const auto failed = registry_.failed_providers();

    JsonValue providers = JsonValue::array();
    for (const auto& name : available) providers.push_back(name);
    JsonValue unavailable = JsonValue::array();
    for (const auto& [name, reason] : failed) unavailable.push_back(name);

    JsonValue body = JsonValue::object();
    body.set("status", available.empty() ? "unavailable" : failed.empty() ? "healthy" : "degraded");
    body.set("service", "polystore");
    body.set("providers", std::move(providers));
    body.set("failed", std::move(unavailable));

    res.status = available.empty() ? http::kServiceUnavailable : http::kOk;
    res.set_content(body.dump(), http::kJsonContentType);
}

void HttpServer::handle_graphql(const httplib::Request& req, httplib::Response& res) {
    std::shared_ptr<GraphQLHandler> graphql;
    {
        std::lock_guard lock(mutex_);
        graphql = graphql_;
    }

    // application/json {"query": "...", "variables": {...}} or a bare document
    std::string document = req.body;
    JsonValue variables = JsonValue::object();
    if (req.get_header_value(http::kContentTypeHeader).starts_with("application/json")) {
        JsonValue envelope;
        try {
            envelope = JsonValue::parse(req.body);
        } catch (const JsonValue::parse_error&) {
            res.status = http::kBadRequest;
            res.set_content(GraphQLHandler::error_response(ErrorCategory::VALIDATION_ERROR,
                "request body is not valid JSON").dump(), http::kJsonContentType);
            return;
        }
        document = envelope.value<std::string>("query", "");
        if (envelope["variables"].is_object()) variables = envelope["variables"];
    }

    if (document.empty()) {
        res.status = http::kBadRequest;
        res.set_content(GraphQLHandler::error_response(ErrorCategory::VALIDATION_ERROR,
            "missing GraphQL query").dump(), http::kJsonContentType);
        return;
    }

    res.set_content(graphql->execute(document, variables).dump(), http::kJsonContentType);
}

} // namespace polystore
