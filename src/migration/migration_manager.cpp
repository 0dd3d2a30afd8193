#include "migration/migration_manager.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace polystore {

// ============================================================================
// MigrationContext
// ============================================================================

QueryBuilder MigrationContext::query() const {
    auto executor = registry_.executor(provider_);
    if (executor.is_error()) {
        return QueryBuilder::unavailable(executor.error_message());
    }
    return QueryBuilder(executor.value());
}

Result<SchemaApplyResult> MigrationContext::create_schema(const SchemaDescriptor& schema) const {
    return schemas_.create_schema(provider_, schema);
}

// ============================================================================
// MigrationManager
// ============================================================================

MigrationManager::MigrationManager(std::shared_ptr<IMigrationLedger> ledger, MigrationContext context)
    : ledger_(std::move(ledger)), context_(std::move(context)) {}

Status MigrationManager::add_migration(Migration migration) {
    if (!migration.up) {
        return Status::error(ErrorCategory::VALIDATION_ERROR,
            std::format("migration '{}' has no up action", migration.name));
    }

    migration.registered_at = utils::now();

    std::lock_guard lock(mutex_);
    auto taken = [&](const std::string& id) {
        return std::any_of(migrations_.begin(), migrations_.end(),
            [&](const Migration& m) { return m.id == id; });
    };

    if (migration.id.empty()) {
        // Registration timestamp; bumped when two land in the same millisecond
        auto stamp = utils::epoch_millis(migration.registered_at);
        while (taken(std::to_string(stamp))) ++stamp;
        migration.id = std::to_string(stamp);
    } else if (taken(migration.id)) {
        return Status::error(ErrorCategory::VALIDATION_ERROR,
            std::format("duplicate migration id '{}'", migration.id));
    }
    if (migration.name.empty()) migration.name = migration.id;

    states_[migration.id] = MigrationState::PENDING;
    migrations_.push_back(std::move(migration));
    return Status::ok();
}

Status MigrationManager::invoke(const Migration::Action& action) {
    try {
        return action(context_);
    } catch (const std::exception& e) {
        return Status::error(ErrorCategory::MIGRATION_FAILURE, e.what());
    }
}

void MigrationManager::set_state(const std::string& id, MigrationState state) {
    std::lock_guard lock(mutex_);
    states_[id] = state;
}

Result<MigrationReport> MigrationManager::run() {
    using R = Result<MigrationReport>;
    std::lock_guard run_lock(run_mutex_);

    std::vector<Migration> migrations;
    {
        std::lock_guard lock(mutex_);
        migrations = migrations_;
    }

    MigrationReport report;
    auto finish = [&](std::string failed_id, std::string message) {
        report.failed = std::move(failed_id);
        report.error = message;
        {
            std::lock_guard lock(mutex_);
            last_report_ = report;
        }
        utils::log::error(message);
        return R::error(ErrorCategory::MIGRATION_FAILURE, std::move(message));
    };

    auto applied = ledger_->applied();
    if (applied.is_error()) {
        return finish("", std::format("migration ledger ({}) unavailable: {}",
            ledger_->kind(), applied.error_message()));
    }

    utils::log::info(std::format("Running {} migrations against '{}'",
        migrations.size(), context_.provider()));

    for (const auto& migration : migrations) {
        if (applied.value().contains(migration.id)) {
            set_state(migration.id, MigrationState::APPLIED);
            report.skipped.push_back(migration.id);
            continue;
        }

        set_state(migration.id, MigrationState::RUNNING);
        utils::log::info(std::format("Running migration: {} ({})", migration.name, migration.id));

        auto st = invoke(migration.up);
        if (st.is_ok()) {
            st = ledger_->record(migration.id, migration.name);
        }
        if (st.is_error()) {
            set_state(migration.id, MigrationState::FAILED);
            return finish(migration.id, std::format("migration '{}' ({}) failed: {}",
                migration.name, migration.id, st.error_message()));
        }

        set_state(migration.id, MigrationState::APPLIED);
        report.applied.push_back(migration.id);
        utils::log::info(std::format("Migration completed: {}", migration.name));
    }

    {
        std::lock_guard lock(mutex_);
        last_report_ = report;
    }
    return R::ok(std::move(report));
}

Status MigrationManager::rollback(const std::string& id) {
    std::lock_guard run_lock(run_mutex_);

    std::optional<Migration> migration;
    {
        std::lock_guard lock(mutex_);
        const auto it = std::find_if(migrations_.begin(), migrations_.end(),
            [&](const Migration& m) { return m.id == id; });
        if (it != migrations_.end()) migration = *it;
    }
    if (!migration) {
        return Status::error(ErrorCategory::NOT_FOUND, std::format("unknown migration '{}'", id));
    }
    if (!migration->down) {
        return Status::error(ErrorCategory::UNSUPPORTED_OPERATION,
            std::format("migration '{}' has no down action", migration->name));
    }

    auto applied = ledger_->applied();
    if (applied.is_error()) return Status::propagate(applied);
    if (!applied.value().contains(id)) {
        return Status::error(ErrorCategory::VALIDATION_ERROR,
            std::format("migration '{}' is not applied", migration->name));
    }

    utils::log::info(std::format("Rolling back migration: {} ({})", migration->name, id));
    auto st = invoke(migration->down);
    if (st.is_ok()) {
        st = ledger_->remove(id);
    }
    if (st.is_error()) {
        set_state(id, MigrationState::FAILED);
        return Status::error(ErrorCategory::MIGRATION_FAILURE,
            std::format("rollback of '{}' ({}) failed: {}", migration->name, id, st.error_message()));
    }

    set_state(id, MigrationState::PENDING);
    return Status::ok();
}

std::optional<MigrationState> MigrationManager::state(const std::string& id) const {
    std::lock_guard lock(mutex_);
    const auto it = states_.find(id);
    if (it == states_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> MigrationManager::migration_ids() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(migrations_.size());
    for (const auto& m : migrations_) ids.push_back(m.id);
    return ids;
}

MigrationReport MigrationManager::last_report() const {
    std::lock_guard lock(mutex_);
    return last_report_;
}

} // namespace polystore
