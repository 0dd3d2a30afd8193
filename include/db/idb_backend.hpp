#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/iexecutor.hpp"
#include <memory>
#include <string>

namespace polystore {

/**
 * @brief Abstract provider backend: turns a ProviderConfig into a live executor
 *
 * Each provider family provides a concrete implementation that creates the
 * right connection pool or driver and probes it before handing out the
 * executor.
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(ProviderKind::POSTGRESQL);
 *   auto executor = backend->connect(provider_config);
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Query model of the executors this backend creates */
    [[nodiscard]] virtual ProviderFamily family() const = 0;

    /**
     * @brief Connect and probe
     * @return Executor, or CONNECTION_ERROR when the provider is unreachable
     */
    [[nodiscard]] virtual Result<std::shared_ptr<IExecutor>> connect(const ProviderConfig& config) = 0;
};

/// Pool settings for a relational provider
[[nodiscard]] PoolConfig make_pool_config(const ProviderConfig& config);

/**
 * @brief Create a pool and prove it can hand out a healthy connection
 *
 * Errors: CONNECTION_ERROR carrying the factory's last native error.
 */
[[nodiscard]] Result<std::shared_ptr<IConnectionPool>> open_probed_pool(
    const ProviderConfig& config, std::shared_ptr<IConnectionFactory> factory);

} // namespace polystore
