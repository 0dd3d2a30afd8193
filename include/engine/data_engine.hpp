#pragma once

#include "api/graphql_generator.hpp"
#include "api/graphql_handler.hpp"
#include "api/http_server.hpp"
#include "api/rest_generator.hpp"
#include "cache/query_cache.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/backend_registry.hpp"
#include "db/connection_registry.hpp"
#include "migration/migration_manager.hpp"
#include "query/query_builder.hpp"
#include "realtime/change_notifier.hpp"
#include "realtime/realtime_gateway.hpp"
#include "realtime/websocket_server.hpp"
#include "schema/schema_manager.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace polystore {

/// Surfaces generated for one exposed entity
struct ExposedEntity {
    std::string provider;
    std::string name;
    std::vector<RestRoute> routes;      // empty when REST is disabled
    std::optional<GraphQLEntity> graphql;
};

/**
 * @brief One long-lived object owning every piece of engine state
 *
 * Lifecycle:
 *   DataEngine engine(config);
 *   engine.initialize();               // connect providers, build services
 *   engine.create_schema("main", users);
 *   engine.expose("main", users);      // REST routes + GraphQL resolvers
 *   engine.run_migrations();
 *   engine.serve();                    // blocks until stop()
 *   engine.shutdown();
 *
 * Everything hands out references into this object; nothing is global
 * except the backend factory registry.
 */
class DataEngine {
public:
    explicit DataEngine(EngineConfig config,
                        const BackendRegistry& backends = BackendRegistry::instance());
    ~DataEngine();

    DataEngine(const DataEngine&) = delete;
    DataEngine& operator=(const DataEngine&) = delete;

    /**
     * @brief Connect every configured provider and build the services
     * @return NO_PROVIDERS_AVAILABLE when nothing connected
     */
    [[nodiscard]] Status initialize();

    [[nodiscard]] bool initialized() const { return initialized_.load(); }

    /// Provider named in [engine] default_provider, else the first connected one
    [[nodiscard]] std::string default_provider() const;

    /// Builder bound to a provider (default provider when empty), sharing the engine cache
    [[nodiscard]] QueryBuilder query(const std::string& provider = "") const;

    [[nodiscard]] Result<SchemaApplyResult> create_schema(const std::string& provider,
                                                          const SchemaDescriptor& schema);

    /**
     * @brief Generate the API surface of an entity and mount it
     *
     * REST routes go to the HTTP server, resolvers to the GraphQL handler,
     * per the [api] switches.
     */
    [[nodiscard]] Result<ExposedEntity> expose(const std::string& provider,
                                               const SchemaDescriptor& schema);

    [[nodiscard]] Status add_migration(Migration migration);

    [[nodiscard]] Result<MigrationReport> run_migrations();

    [[nodiscard]] Status publish(const std::string& channel, const JsonValue& payload);

    [[nodiscard]] Result<std::shared_ptr<Subscription>> subscribe(const std::string& channel);

    /**
     * @brief Start the realtime listener and serve HTTP
     *
     * Blocks while the HTTP server runs. Throws std::runtime_error when a
     * listener cannot bind.
     */
    void serve();

    /// Unblocks serve(); safe from another thread
    void stop();

    /**
     * @brief Stop listeners, close subscriptions, drop the cache, close providers
     *
     * Idempotent: a second call returns an empty report.
     */
    std::vector<ProviderCloseReport> shutdown();

    // ---- accessors ----
    [[nodiscard]] const EngineConfig& config() const { return config_; }
    [[nodiscard]] ConnectionRegistry& registry() { return *registry_; }
    [[nodiscard]] SchemaManager& schemas() { return *schemas_; }
    [[nodiscard]] ChangeNotifier& notifier() { return *notifier_; }
    [[nodiscard]] std::shared_ptr<QueryCache> cache() const { return cache_; }
    [[nodiscard]] GraphQLHandler& graphql() { return *graphql_; }
    [[nodiscard]] std::shared_ptr<RealtimeGateway> gateway() const { return gateway_; }
    [[nodiscard]] HttpServer& http() { return *http_; }

    /// nullptr before initialize()
    [[nodiscard]] MigrationManager* migrations() { return migrations_.get(); }

private:
    [[nodiscard]] ApiContext api_context() const;

    [[nodiscard]] std::shared_ptr<IMigrationLedger> make_ledger(const std::string& provider) const;

    const EngineConfig config_;

    std::unique_ptr<ConnectionRegistry> registry_;
    std::shared_ptr<QueryCache> cache_;
    std::unique_ptr<SchemaManager> schemas_;
    std::unique_ptr<ChangeNotifier> notifier_;
    std::shared_ptr<RealtimeGateway> gateway_;
    std::shared_ptr<GraphQLHandler> graphql_;
    std::unique_ptr<HttpServer> http_;
    std::unique_ptr<WebSocketServer> websocket_;
    std::unique_ptr<MigrationManager> migrations_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shut_down_{false};
};

} // namespace polystore
