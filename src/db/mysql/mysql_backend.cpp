#include "db/mysql/mysql_backend.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "db/relational_executor.hpp"
#include "db/backend_registry.hpp"

namespace polystore {

Result<std::shared_ptr<IExecutor>> MysqlBackend::connect(const ProviderConfig& config) {
    auto pool = open_probed_pool(config, std::make_shared<MysqlConnectionFactory>());
    if (pool.is_error()) {
        return Result<std::shared_ptr<IExecutor>>::propagate(pool);
    }
    return Result<std::shared_ptr<IExecutor>>::ok(std::make_shared<RelationalExecutor>(
        config.name, ProviderKind::MYSQL, std::move(pool.value()),
        config.pool_acquire_timeout));
}

// Auto-register MySQL backend at static initialization
namespace {
    struct MysqlBackendRegistrar {
        MysqlBackendRegistrar() {
            BackendRegistry::instance().register_backend(
                ProviderKind::MYSQL,
                [] { return std::make_unique<MysqlBackend>(); });
        }
    };
    static MysqlBackendRegistrar mysql_registrar;
}

} // namespace polystore
