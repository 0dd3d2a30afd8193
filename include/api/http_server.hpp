#pragma once

#include "api/api_types.hpp"
#include "api/graphql_handler.hpp"
#include "api/rest_generator.hpp"
#include "config/config_types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace polystore {

class ConnectionRegistry;

/**
 * @brief HTTP front for the generated API surface
 *
 * Mounts generated REST routes, POST {graphql endpoint} (plus
 * GET {graphql endpoint}/schema for the SDL) and GET /health. Routes are
 * collected before start(); start() blocks until stop().
 */
class HttpServer {
public:
    HttpServer(const ServerConfig& config, ConnectionRegistry& registry);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void add_routes(std::vector<RestRoute> routes);

    void set_graphql(std::shared_ptr<GraphQLHandler> handler);

    // Blocking: registers routes and listens. Throws if the port cannot be bound.
    void start();

    void stop();

    [[nodiscard]] bool is_running() const;

    [[nodiscard]] size_t route_count() const;

    // Translate between httplib and the transport-neutral handler types
    [[nodiscard]] static ApiRequest to_api_request(const httplib::Request& req);
    static void write_response(const ApiResponse& response, httplib::Response& res);

private:
    void register_rest_routes(httplib::Server& svr);
    void register_graphql_routes(httplib::Server& svr);

    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_graphql(const httplib::Request& req, httplib::Response& res);

    const ServerConfig config_;
    ConnectionRegistry& registry_;

    mutable std::mutex mutex_;
    std::vector<RestRoute> routes_;
    std::shared_ptr<GraphQLHandler> graphql_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace polystore
