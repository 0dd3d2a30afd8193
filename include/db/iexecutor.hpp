#pragma once

#include "core/error.hpp"
#include "core/provider_type.hpp"
#include "core/types.hpp"
#include "query/query_descriptor.hpp"
#include "schema/schema_descriptor.hpp"

#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace polystore {

/**
 * @brief Outcome of ensuring a schema on one provider
 */
struct SchemaApplyResult {
    std::string table;
    bool created = false;                  // true once the table/collection is known to exist
    std::vector<std::string> statements;   // DDL issued (empty for document providers)

    [[nodiscard]] JsonValue to_json() const {
        JsonValue out = JsonValue::object();
        out.set("table", table);
        out.set("created", created);
        return out;
    }
};

/**
 * @brief Capability interface of one connected provider
 *
 * Selected once at connect time by the backend for the provider's family
 * and stored polymorphically in the ConnectionRegistry. Implementations
 * must be safe to call from concurrent operations.
 */
class IExecutor {
public:
    virtual ~IExecutor() = default;

    /// Routing key from configuration
    [[nodiscard]] virtual const std::string& name() const = 0;

    [[nodiscard]] virtual ProviderKind kind() const = 0;

    [[nodiscard]] ProviderFamily family() const { return provider_family(kind()); }

    [[nodiscard]] ProviderCapabilities capabilities() const { return provider_capabilities(kind()); }

    /**
     * @brief Compile and run one Query Descriptor
     *
     * Errors: UNSUPPORTED_OPERATION for descriptors this family cannot
     * express, VALIDATION_ERROR for bad identifiers/payloads and constraint
     * violations, NO_CONNECTION when no connection can be obtained,
     * DRIVER_ERROR ("<provider> <operation> failed: ...") otherwise.
     */
    [[nodiscard]] virtual Result<QueryOutput> execute(const QueryDescriptor& desc) = 0;

    /// Idempotently create the table/collection for a schema
    [[nodiscard]] virtual Result<SchemaApplyResult> ensure_schema(const SchemaDescriptor& schema) = 0;

    /// Liveness probe: SELECT 1 or driver ping
    [[nodiscard]] virtual Status ping() = 0;

    /// Release every resource; later calls fail with NO_CONNECTION
    virtual Status close() = 0;
};

/// "<provider> <operation> failed: <message>" with the matching category
[[nodiscard]] inline Status wrap_driver_failure(std::string_view provider, std::string_view operation,
                                                std::string_view message,
                                                bool constraint_violation = false) {
    return Status::error(
        constraint_violation ? ErrorCategory::VALIDATION_ERROR : ErrorCategory::DRIVER_ERROR,
        std::format("{} {} failed: {}", provider, operation, message));
}

} // namespace polystore
