#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include "db/connection_registry.hpp"
#include "db/iexecutor.hpp"
#include "schema/schema_descriptor.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polystore {

namespace schema_status {
inline constexpr std::string_view kApplied = "applied";
inline constexpr std::string_view kFailed  = "failed";
} // namespace schema_status

struct SchemaManagementConfig {
    size_t max_history_entries = 1000;
};

/// One attempt to apply a schema to a provider
struct SchemaSnapshot {
    std::string id;         // UUID
    std::string provider;
    std::string table;
    std::vector<std::string> statements;
    std::chrono::system_clock::time_point timestamp;
    std::string status;     // "applied", "failed"
    std::string message;

    SchemaSnapshot()
        : id(utils::generate_uuid()),
          timestamp(std::chrono::system_clock::now()) {}
};

/**
 * @brief Applies Schema Descriptors to providers and keeps the catalog
 *
 * Relational providers receive idempotent DDL; document providers get a
 * collection-ensure call and the descriptor is retained for validation.
 * The catalog is keyed by (provider, schema name).
 */
class SchemaManager {
public:
    SchemaManager(ConnectionRegistry& registry, const SchemaManagementConfig& config = {});

    /**
     * @brief createSchema(provider, descriptor)
     *
     * Safe to repeat with the same descriptor. Errors: VALIDATION_ERROR for
     * a malformed descriptor, NO_CONNECTION for an unavailable provider,
     * DRIVER_ERROR when the provider rejects the DDL.
     */
    [[nodiscard]] Result<SchemaApplyResult> create_schema(const std::string& provider,
                                                          const SchemaDescriptor& schema);

    /// Add to the catalog without touching the provider
    [[nodiscard]] Status register_schema(const std::string& provider, const SchemaDescriptor& schema);

    [[nodiscard]] std::optional<SchemaDescriptor> find_schema(const std::string& provider,
                                                              const std::string& name) const;

    [[nodiscard]] std::vector<SchemaDescriptor> schemas(const std::string& provider) const;

    /**
     * @brief Check a write payload against a registered schema
     *
     * Unknown fields and mistyped values are rejected. For full writes
     * (partial = false) every non-nullable field without a default or
     * generated value must be present.
     */
    [[nodiscard]] Status validate_record(const std::string& provider, const std::string& name,
                                         const JsonValue& record, bool partial) const;

    [[nodiscard]] std::vector<SchemaSnapshot> get_history(const std::string& provider = "",
        const std::string& table = "", size_t limit = 50) const;
    [[nodiscard]] size_t history_size() const;

    [[nodiscard]] const SchemaManagementConfig& config() const { return config_; }

private:
    void record(SchemaSnapshot snapshot);

    ConnectionRegistry& registry_;
    SchemaManagementConfig config_;
    mutable std::shared_mutex mutex_;
    std::map<std::pair<std::string, std::string>, SchemaDescriptor> catalog_;
    std::deque<SchemaSnapshot> history_;
};

} // namespace polystore
