#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/backend_registry.hpp"
#include "db/iexecutor.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace polystore {

/// Per-provider outcome of ConnectionRegistry::close()
struct ProviderCloseReport {
    std::string provider;
    bool ok = true;
    std::string message;
};

/**
 * @brief Holds one connected executor per configured provider
 *
 * Providers that fail to connect or to answer the liveness probe are logged
 * and excluded from routing; startup only fails when none are left.
 * Executors are shared with callers, who borrow them per operation.
 *
 * Thread-safety: lookups take a shared lock, connect/close an exclusive one.
 */
class ConnectionRegistry {
public:
    explicit ConnectionRegistry(const BackendRegistry& backends = BackendRegistry::instance());
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * @brief Connect one provider and make it routable
     * @return Executor, or CONNECTION_ERROR (the provider is then excluded)
     */
    Result<std::shared_ptr<IExecutor>> connect(const ProviderConfig& config);

    /**
     * @brief Connect every configured provider
     * @return NO_PROVIDERS_AVAILABLE when not a single provider connected
     */
    Status initialize(const std::vector<ProviderConfig>& providers);

    /// Route to an already-connected executor (embedding, tests)
    void attach(std::shared_ptr<IExecutor> executor);

    /// NO_CONNECTION when the provider is unknown, failed or closed
    [[nodiscard]] Result<std::shared_ptr<IExecutor>> executor(const std::string& name) const;

    [[nodiscard]] bool is_available(const std::string& name) const;

    /// Connected providers in connection order
    [[nodiscard]] std::vector<std::string> available_providers() const;

    /// Excluded providers with the reason they were excluded
    [[nodiscard]] std::map<std::string, std::string> failed_providers() const;

    /**
     * @brief Close every executor, collecting failures instead of stopping
     *
     * Idempotent: a second call returns an empty report.
     */
    std::vector<ProviderCloseReport> close();

private:
    void register_executor(std::shared_ptr<IExecutor> executor);

    const BackendRegistry& backends_;

    mutable std::shared_mutex mutex_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, std::shared_ptr<IExecutor>> executors_;
    std::map<std::string, std::string> failures_;
    bool closed_ = false;
};

} // namespace polystore
