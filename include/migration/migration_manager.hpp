#pragma once

#include "core/error.hpp"
#include "migration/migration_ledger.hpp"
#include "query/query_builder.hpp"
#include "schema/schema_manager.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace polystore {

enum class MigrationState {
    PENDING,
    RUNNING,
    APPLIED,
    FAILED,
};

[[nodiscard]] inline std::string_view migration_state_to_string(MigrationState state) {
    switch (state) {
        case MigrationState::PENDING: return "pending";
        case MigrationState::RUNNING: return "running";
        case MigrationState::APPLIED: return "applied";
        case MigrationState::FAILED: return "failed";
        default: return "pending";
    }
}

/**
 * @brief What a migration action can touch: its target provider
 */
class MigrationContext {
public:
    MigrationContext(ConnectionRegistry& registry, SchemaManager& schemas, std::string provider)
        : registry_(registry), schemas_(schemas), provider_(std::move(provider)) {}

    [[nodiscard]] const std::string& provider() const { return provider_; }

    /// Uncached builder bound to the target provider
    [[nodiscard]] QueryBuilder query() const;

    [[nodiscard]] Result<SchemaApplyResult> create_schema(const SchemaDescriptor& schema) const;

private:
    ConnectionRegistry& registry_;
    SchemaManager& schemas_;
    std::string provider_;
};

struct Migration {
    using Action = std::function<Status(MigrationContext&)>;

    std::string id;                     // empty = registration time in epoch ms
    std::string name;
    Action up;
    Action down;                        // optional, manual rollback only
    std::chrono::system_clock::time_point registered_at{};
};

struct MigrationReport {
    std::vector<std::string> applied;
    std::vector<std::string> skipped;
    std::string failed;                 // id of the failing migration, if any
    std::string error;
};

/**
 * @brief Runs registered migrations once per target store
 *
 * Pending -> Running -> Applied | Failed. Migrations run strictly in
 * registration order and one at a time; ids already in the ledger go
 * straight to Applied. The first failure stops the run.
 */
class MigrationManager {
public:
    MigrationManager(std::shared_ptr<IMigrationLedger> ledger, MigrationContext context);

    /// VALIDATION_ERROR on a duplicate id or a missing up action
    [[nodiscard]] Status add_migration(Migration migration);

    /// MIGRATION_FAILURE when a forward action or the ledger fails
    [[nodiscard]] Result<MigrationReport> run();

    /// Run `down` for an applied migration and drop it from the ledger
    [[nodiscard]] Status rollback(const std::string& id);

    [[nodiscard]] std::optional<MigrationState> state(const std::string& id) const;

    [[nodiscard]] std::vector<std::string> migration_ids() const;

    /// Report of the most recent run(), also kept when it failed
    [[nodiscard]] MigrationReport last_report() const;

    [[nodiscard]] const IMigrationLedger& ledger() const { return *ledger_; }

private:
    /// Runs an action, turning thrown exceptions into a failed Status
    Status invoke(const Migration::Action& action);

    void set_state(const std::string& id, MigrationState state);

    std::shared_ptr<IMigrationLedger> ledger_;
    MigrationContext context_;

    mutable std::mutex mutex_;          // registry of migrations and states
    std::mutex run_mutex_;              // one run/rollback at a time
    std::vector<Migration> migrations_;
    std::unordered_map<std::string, MigrationState> states_;
    MigrationReport last_report_;
};

} // namespace polystore
