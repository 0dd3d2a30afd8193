#pragma once

#include "db/idb_backend.hpp"
#include "core/provider_type.hpp"
#include <format>
#include <functional>
#include <memory>
#include <stdexcept>
#include <unordered_map>

namespace polystore {

/**
 * @brief Registry for provider backends
 *
 * Built-in backends register themselves into instance() at static
 * initialization; the relational ones only when compiled in
 * (ENABLE_POSTGRESQL / ENABLE_MYSQL). Standalone registries can be built
 * for embedding and tests.
 *
 * Usage:
 *   // Registration (in pg_backend.cpp):
 *   BackendRegistry::instance().register_backend(
 *       ProviderKind::POSTGRESQL, []{ return std::make_unique<PgBackend>(); });
 *
 *   // Creation (in ConnectionRegistry):
 *   auto backend = BackendRegistry::instance().create(ProviderKind::POSTGRESQL);
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    BackendRegistry() = default;

    static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    void register_backend(ProviderKind kind, Factory factory) {
        factories_[kind] = std::move(factory);
    }

    [[nodiscard]] std::unique_ptr<IDbBackend> create(ProviderKind kind) const {
        const auto it = factories_.find(kind);
        if (it == factories_.end()) {
            throw std::runtime_error(std::format(
                "No backend registered for provider type: {}", provider_kind_to_string(kind)));
        }
        return it->second();
    }

    [[nodiscard]] bool has_backend(ProviderKind kind) const {
        return factories_.count(kind) > 0;
    }

private:
    struct ProviderKindHash {
        size_t operator()(ProviderKind k) const {
            return std::hash<int>()(static_cast<int>(k));
        }
    };

    std::unordered_map<ProviderKind, Factory, ProviderKindHash> factories_;
};

} // namespace polystore
