#pragma once

#include "db/idb_backend.hpp"

namespace polystore {

/**
 * @brief Backend for the document family (document, wide-column,
 * managed-document, graph-document kinds)
 *
 * `driver = "memory"` serves collections from process memory;
 * `driver = "jsonb"` stores them in a PostgreSQL server and requires
 * the build to include PostgreSQL support.
 * Auto-registers for all four kinds at static init time.
 */
class DocumentBackend : public IDbBackend {
public:
    explicit DocumentBackend(ProviderKind kind) : kind_(kind) {}

    [[nodiscard]] ProviderFamily family() const override {
        return ProviderFamily::DOCUMENT;
    }

    [[nodiscard]] Result<std::shared_ptr<IExecutor>> connect(const ProviderConfig& config) override;

private:
    ProviderKind kind_;
};

} // namespace polystore
