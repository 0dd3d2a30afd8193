#include "db/connection_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace polystore {

ConnectionRegistry::ConnectionRegistry(const BackendRegistry& backends)
    : backends_(backends) {}

ConnectionRegistry::~ConnectionRegistry() {
    (void)close();
}

void ConnectionRegistry::register_executor(std::shared_ptr<IExecutor> executor) {
    std::shared_ptr<IExecutor> replaced;
    {
        std::unique_lock lock(mutex_);
        const auto& name = executor->name();
        failures_.erase(name);
        auto& slot = executors_[name];
        if (slot) {
            replaced = std::move(slot);
        } else {
            order_.push_back(name);
        }
        slot = std::move(executor);
        closed_ = false;
    }
    if (replaced) {
        const auto st = replaced->close();
        if (st.is_error()) {
            utils::log::warn(std::format("Replaced provider '{}' did not close cleanly: {}",
                replaced->name(), st.error_message()));
        }
    }
}

Result<std::shared_ptr<IExecutor>> ConnectionRegistry::connect(const ProviderConfig& config) {
    using R = Result<std::shared_ptr<IExecutor>>;
    const auto kind = provider_kind_to_string(config.kind);

    auto fail = [&](std::string message) {
        utils::log::warn(std::format("Provider '{}' ({}) excluded: {}", config.name, kind, message));
        std::unique_lock lock(mutex_);
        failures_[config.name] = message;
        return R::error(ErrorCategory::CONNECTION_ERROR, std::move(message));
    };

    if (!backends_.has_backend(config.kind)) {
        return fail(std::format("no backend for provider type '{}' in this build", kind));
    }

    const utils::Timer timer;
    auto result = backends_.create(config.kind)->connect(config);
    if (result.is_error()) {
        return fail(result.error_message());
    }

    auto executor = result.value();
    const auto probe = executor->ping();
    if (probe.is_error()) {
        const auto st = executor->close();
        if (st.is_error()) {
            utils::log::debug(std::format("Provider '{}': {}", config.name, st.error_message()));
        }
        return fail(probe.error_message());
    }

    register_executor(executor);
    utils::log::info(std::format("Provider '{}' ({}) connected in {}ms",
        config.name, kind, timer.elapsed_ms().count()));
    return R::ok(std::move(executor));
}

Status ConnectionRegistry::initialize(const std::vector<ProviderConfig>& providers) {
    size_t connected = 0;
    for (const auto& config : providers) {
        if (connect(config).is_ok()) ++connected;
    }

    if (connected == 0) {
        utils::log::error(std::format("No providers available ({} configured)", providers.size()));
        return Status::error(ErrorCategory::NO_PROVIDERS_AVAILABLE,
            std::format("no providers available: {} configured, 0 connected", providers.size()));
    }

    utils::log::info(std::format("Connection registry ready: {}/{} providers available",
        connected, providers.size()));
    return Status::ok();
}

void ConnectionRegistry::attach(std::shared_ptr<IExecutor> executor) {
    register_executor(std::move(executor));
}

Result<std::shared_ptr<IExecutor>> ConnectionRegistry::executor(const std::string& name) const {
    using R = Result<std::shared_ptr<IExecutor>>;
    std::shared_lock lock(mutex_);
    const auto it = executors_.find(name);
    if (it != executors_.end()) {
        return R::ok(it->second);
    }
    if (const auto failed = failures_.find(name); failed != failures_.end()) {
        return R::error(ErrorCategory::NO_CONNECTION,
            std::format("provider '{}' is unavailable: {}", name, failed->second));
    }
    return R::error(ErrorCategory::NO_CONNECTION, std::format("provider '{}' is not connected", name));
}

bool ConnectionRegistry::is_available(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return executors_.contains(name);
}

std::vector<std::string> ConnectionRegistry::available_providers() const {
    std::shared_lock lock(mutex_);
    return order_;
}

std::map<std::string, std::string> ConnectionRegistry::failed_providers() const {
    std::shared_lock lock(mutex_);
    return failures_;
}

std::vector<ProviderCloseReport> ConnectionRegistry::close() {
    std::vector<std::shared_ptr<IExecutor>> to_close;
    {
        std::unique_lock lock(mutex_);
        if (closed_) return {};
        closed_ = true;
        for (const auto& name : order_) to_close.push_back(executors_[name]);
        executors_.clear();
        order_.clear();
    }

    std::vector<ProviderCloseReport> report;
    report.reserve(to_close.size());
    for (const auto& executor : to_close) {
        ProviderCloseReport entry{executor->name(), true, {}};
        try {
            const auto st = executor->close();
            if (st.is_error()) {
                entry.ok = false;
                entry.message = st.error_message();
            }
        } catch (const std::exception& e) {
            entry.ok = false;
            entry.message = e.what();
        }
        if (!entry.ok) {
            utils::log::warn(std::format("Provider '{}' failed to close: {}",
                entry.provider, entry.message));
        }
        report.push_back(std::move(entry));
    }
    return report;
}

} // namespace polystore
