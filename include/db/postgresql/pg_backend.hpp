#pragma once

#include "db/idb_backend.hpp"

namespace polystore {

/**
 * @brief PostgreSQL backend
 *
 * Creates PgConnectionFactory -> GenericConnectionPool -> RelationalExecutor.
 * Auto-registers with BackendRegistry at static init time.
 */
class PgBackend : public IDbBackend {
public:
    [[nodiscard]] ProviderFamily family() const override {
        return ProviderFamily::RELATIONAL;
    }

    [[nodiscard]] Result<std::shared_ptr<IExecutor>> connect(const ProviderConfig& config) override;

    /** @brief Probed PostgreSQL pool, also used by the JSONB document driver */
    [[nodiscard]] static Result<std::shared_ptr<IConnectionPool>> create_pool(
        const ProviderConfig& config);
};

} // namespace polystore
