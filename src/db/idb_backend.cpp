#include "db/idb_backend.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/generic_connection_pool.hpp"

#include <format>

namespace polystore {

PoolConfig make_pool_config(const ProviderConfig& config) {
    PoolConfig pool;
    pool.connection_string = ConfigLoader::build_connection_string(config);
    pool.min_connections = config.min_connections;
    pool.max_connections = config.max_connections;
    pool.connection_timeout = config.connection_timeout;
    pool.idle_timeout = config.idle_timeout;
    pool.query_timeout_ms = static_cast<uint32_t>(config.query_timeout.count());
    return pool;
}

Result<std::shared_ptr<IConnectionPool>> open_probed_pool(
    const ProviderConfig& config, std::shared_ptr<IConnectionFactory> factory) {

    using R = Result<std::shared_ptr<IConnectionPool>>;

    auto pool_config = make_pool_config(config);
    utils::log::debug(std::format("Provider '{}': connecting with {}",
        config.name, utils::redact_connection_string(pool_config.connection_string)));

    auto pool = std::make_shared<GenericConnectionPool>(config.name, pool_config, factory);

    auto conn = pool->acquire(config.connection_timeout);
    if (!conn) {
        const auto native = factory->last_error();
        pool->drain();
        return R::error(ErrorCategory::CONNECTION_ERROR,
            std::format("provider '{}' ({}) unreachable: {}", config.name,
                provider_kind_to_string(config.kind),
                native.empty() ? std::string("connection failed") : native));
    }
    if (!(*conn)->is_healthy(pool_config.health_check_query)) {
        conn->mark_broken();
        conn.reset();
        pool->drain();
        return R::error(ErrorCategory::CONNECTION_ERROR,
            std::format("provider '{}' ({}) failed its health check", config.name,
                provider_kind_to_string(config.kind)));
    }
    return R::ok(std::move(pool));
}

} // namespace polystore
