#include "db/document/document_backend.hpp"
#include "db/backend_registry.hpp"
#include "db/document/document_executor.hpp"
#include "db/document/jsonb_document_driver.hpp"
#include "db/document/memory_document_driver.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_backend.hpp"
#endif

#include <format>

namespace polystore {

Result<std::shared_ptr<IExecutor>> DocumentBackend::connect(const ProviderConfig& config) {
    using R = Result<std::shared_ptr<IExecutor>>;

    std::shared_ptr<IDocumentDriver> driver;
    if (config.driver.empty() || config.driver == "memory") {
        driver = std::make_shared<MemoryDocumentDriver>();
    } else if (config.driver == "jsonb") {
#ifdef ENABLE_POSTGRESQL
        auto pool = PgBackend::create_pool(config);
        if (pool.is_error()) return R::propagate(pool);
        driver = std::make_shared<JsonbDocumentDriver>(std::move(pool.value()),
            config.pool_acquire_timeout);
#else
        return R::error(ErrorCategory::CONNECTION_ERROR,
            std::format("provider '{}': the jsonb driver needs a build with PostgreSQL support",
                config.name));
#endif
    } else {
        return R::error(ErrorCategory::CONNECTION_ERROR,
            std::format("provider '{}': unknown document driver '{}'", config.name, config.driver));
    }

    const auto st = driver->ping();
    if (st.is_error()) {
        return R::error(ErrorCategory::CONNECTION_ERROR,
            std::format("provider '{}' ({}) unreachable: {}", config.name,
                driver->driver_name(), st.error_message()));
    }
    return R::ok(std::make_shared<DocumentExecutor>(config.name, kind_, std::move(driver)));
}

// Auto-register the document family at static initialization
namespace {
    struct DocumentBackendRegistrar {
        DocumentBackendRegistrar() {
            for (const auto kind : {ProviderKind::DOCUMENT, ProviderKind::WIDE_COLUMN,
                                    ProviderKind::MANAGED_DOCUMENT, ProviderKind::GRAPH_DOCUMENT}) {
                BackendRegistry::instance().register_backend(
                    kind, [kind] { return std::make_unique<DocumentBackend>(kind); });
            }
        }
    };
    static DocumentBackendRegistrar document_registrar;
}

} // namespace polystore
