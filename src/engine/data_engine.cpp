#include "engine/data_engine.hpp"
#include "core/utils.hpp"

#include <format>

namespace polystore {

namespace {

QueryCache::Config to_cache_config(const CacheConfig& cfg) {
    QueryCache::Config out;
    out.enabled = cfg.enabled;
    out.max_entries = cfg.max_entries;
    out.num_shards = cfg.num_shards;
    out.ttl = cfg.ttl;
    return out;
}

GraphQLConfig to_graphql_config(const ApiConfig& cfg) {
    GraphQLConfig out;
    out.enabled = cfg.graphql_enabled;
    return out;
}

Status not_initialized() {
    return Status::error(ErrorCategory::NO_CONNECTION, "engine is not initialized");
}

} // namespace

DataEngine::DataEngine(EngineConfig config, const BackendRegistry& backends)
    : config_(std::move(config)),
      registry_(std::make_unique<ConnectionRegistry>(backends)),
      cache_(std::make_shared<QueryCache>(to_cache_config(config_.cache))),
      schemas_(std::make_unique<SchemaManager>(*registry_)),
      notifier_(std::make_unique<ChangeNotifier>(config_.realtime.max_queue)),
      gateway_(std::make_shared<RealtimeGateway>(config_.realtime.max_queue)),
      graphql_(std::make_shared<GraphQLHandler>(*notifier_, to_graphql_config(config_.api))),
      http_(std::make_unique<HttpServer>(config_.server, *registry_)) {
    if (config_.realtime.enabled) {
        notifier_->add_sink(gateway_);
    }
}

DataEngine::~DataEngine() {
    shutdown();
}

// ============================================================================
// Startup
// ============================================================================

Status DataEngine::initialize() {
    std::lock_guard lock(lifecycle_mutex_);
    if (initialized_) return Status::ok();

    utils::log::info(std::format("[1/3] Connecting {} provider(s)", config_.providers.size()));
    const auto connected = registry_->initialize(config_.providers);
    if (connected.is_error()) return connected;

    // Migrations target [migrations] provider, else the default provider
    const auto target = config_.migrations.provider.empty()
        ? default_provider() : config_.migrations.provider;
    utils::log::info(std::format("[2/3] Migration ledger: {} on '{}'",
        config_.migrations.ledger, target));
    migrations_ = std::make_unique<MigrationManager>(make_ledger(target),
        MigrationContext(*registry_, *schemas_, target));

    if (config_.api.graphql_enabled) {
        http_->set_graphql(graphql_);
    }

    utils::log::info(std::format("[3/3] Engine ready (default provider '{}', cache {})",
        default_provider(), cache_->is_enabled() ? "on" : "off"));
    initialized_ = true;
    return Status::ok();
}

std::shared_ptr<IMigrationLedger> DataEngine::make_ledger(const std::string& provider) const {
    if (config_.migrations.ledger == "memory") {
        return std::make_shared<MemoryMigrationLedger>();
    }
    auto executor = registry_->executor(provider);
    if (executor.is_error()) {
        utils::log::warn(std::format("Migration ledger provider '{}' unavailable ({}), "
            "falling back to the in-memory ledger", provider, executor.error_message()));
        return std::make_shared<MemoryMigrationLedger>();
    }
    return std::make_shared<StoreMigrationLedger>(executor.value(), config_.migrations.table);
}

std::string DataEngine::default_provider() const {
    if (!config_.engine.default_provider.empty()) return config_.engine.default_provider;
    const auto available = registry_->available_providers();
    return available.empty() ? std::string{} : available.front();
}

// ============================================================================
// Data access
// ============================================================================

QueryBuilder DataEngine::query(const std::string& provider) const {
    const auto name = provider.empty() ? default_provider() : provider;
    auto executor = registry_->executor(name);
    if (executor.is_error()) {
        return QueryBuilder::unavailable(executor.error_message());
    }
    return QueryBuilder(executor.value(), cache_);
}

Result<SchemaApplyResult> DataEngine::create_schema(const std::string& provider,
                                                    const SchemaDescriptor& schema) {
    return schemas_->create_schema(provider.empty() ? default_provider() : provider, schema);
}

ApiContext DataEngine::api_context() const {
    return ApiContext{*registry_, *schemas_, *notifier_, cache_, config_.api,
                      config_.cache.invalidate_on_write};
}

Result<ExposedEntity> DataEngine::expose(const std::string& provider, const SchemaDescriptor& schema) {
    using R = Result<ExposedEntity>;
    const auto name = provider.empty() ? default_provider() : provider;
    if (!registry_->is_available(name)) {
        return R::error(ErrorCategory::NO_CONNECTION,
            std::format("provider '{}' is not available", name));
    }

    ExposedEntity exposed;
    exposed.provider = name;
    exposed.name = schema.name;

    if (config_.api.rest_enabled) {
        auto routes = RestGenerator(api_context()).generate(name, schema);
        if (routes.is_error()) return R::propagate(routes);
        exposed.routes = routes.value();
        http_->add_routes(std::move(routes.value()));
    }

    if (config_.api.graphql_enabled) {
        auto entity = GraphQLGenerator(api_context()).generate(name, schema, *graphql_);
        if (entity.is_error()) return R::propagate(entity);
        exposed.graphql = std::move(entity.value());
    }

    return R::ok(std::move(exposed));
}

// ============================================================================
// Migrations and realtime
// ============================================================================

Status DataEngine::add_migration(Migration migration) {
    if (!migrations_) return not_initialized();
    return migrations_->add_migration(std::move(migration));
}

Result<MigrationReport> DataEngine::run_migrations() {
    if (!migrations_) return Result<MigrationReport>::propagate(not_initialized());
    return migrations_->run();
}

Status DataEngine::publish(const std::string& channel, const JsonValue& payload) {
    return notifier_->publish(channel, payload);
}

Result<std::shared_ptr<Subscription>> DataEngine::subscribe(const std::string& channel) {
    return notifier_->subscribe(channel);
}

// ============================================================================
// Serving and shutdown
// ============================================================================

void DataEngine::serve() {
    if (config_.realtime.enabled) {
        {
            std::lock_guard lock(lifecycle_mutex_);
            websocket_ = std::make_unique<WebSocketServer>(gateway_, config_.realtime);
        }
        websocket_->start();
    }
    if (config_.server.enabled) {
        http_->start();
    }
}

void DataEngine::stop() {
    http_->stop();
    std::lock_guard lock(lifecycle_mutex_);
    if (websocket_) websocket_->stop();
}

std::vector<ProviderCloseReport> DataEngine::shutdown() {
    if (shut_down_.exchange(true)) return {};

    stop();
    notifier_->shutdown();
    cache_->clear();

    auto reports = registry_->close();
    for (const auto& report : reports) {
        if (!report.ok) {
            utils::log::warn(std::format("Closing provider '{}' failed: {}",
                report.provider, report.message));
        }
    }
    utils::log::info("Engine shut down");
    return reports;
}

} // namespace polystore
