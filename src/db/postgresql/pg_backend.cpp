#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/relational_executor.hpp"
#include "db/backend_registry.hpp"

namespace polystore {

Result<std::shared_ptr<IConnectionPool>> PgBackend::create_pool(const ProviderConfig& config) {
    return open_probed_pool(config, std::make_shared<PgConnectionFactory>());
}

Result<std::shared_ptr<IExecutor>> PgBackend::connect(const ProviderConfig& config) {
    auto pool = create_pool(config);
    if (pool.is_error()) {
        return Result<std::shared_ptr<IExecutor>>::propagate(pool);
    }
    return Result<std::shared_ptr<IExecutor>>::ok(std::make_shared<RelationalExecutor>(
        config.name, ProviderKind::POSTGRESQL, std::move(pool.value()),
        config.pool_acquire_timeout));
}

// Auto-register PostgreSQL backend at static initialization
namespace {
    struct PgBackendRegistrar {
        PgBackendRegistrar() {
            BackendRegistry::instance().register_backend(
                ProviderKind::POSTGRESQL,
                [] { return std::make_unique<PgBackend>(); });
        }
    };
    static PgBackendRegistrar pg_registrar;
}

} // namespace polystore
