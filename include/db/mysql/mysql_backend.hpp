#pragma once

#include "db/idb_backend.hpp"

namespace polystore {

/**
 * @brief MySQL backend
 *
 * Creates MysqlConnectionFactory -> GenericConnectionPool -> RelationalExecutor
 * (with client-side RETURNING emulation).
 * Auto-registers with BackendRegistry at static init time.
 */
class MysqlBackend : public IDbBackend {
public:
    [[nodiscard]] ProviderFamily family() const override {
        return ProviderFamily::RELATIONAL;
    }

    [[nodiscard]] Result<std::shared_ptr<IExecutor>> connect(const ProviderConfig& config) override;
};

} // namespace polystore
