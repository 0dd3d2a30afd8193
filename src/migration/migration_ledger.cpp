#include "migration/migration_ledger.hpp"
#include "core/utils.hpp"
#include "query/query_builder.hpp"

#include <format>

namespace polystore {

// ============================================================================
// MemoryMigrationLedger
// ============================================================================

Result<std::set<std::string>> MemoryMigrationLedger::applied() {
    std::lock_guard lock(mutex_);
    return Result<std::set<std::string>>::ok(applied_);
}

Status MemoryMigrationLedger::record(const std::string& id, const std::string& /*name*/) {
    std::lock_guard lock(mutex_);
    applied_.insert(id);
    return Status::ok();
}

Status MemoryMigrationLedger::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    applied_.erase(id);
    return Status::ok();
}

// ============================================================================
// StoreMigrationLedger
// ============================================================================

StoreMigrationLedger::StoreMigrationLedger(std::shared_ptr<IExecutor> executor, std::string table)
    : executor_(std::move(executor)), table_(std::move(table)) {}

Status StoreMigrationLedger::ensure_table() {
    if (ready_) return Status::ok();

    SchemaDescriptor schema;
    schema.name = table_;
    FieldDescriptor id;
    id.name = "id";
    id.primary_key = true;
    id.nullable = false;
    FieldDescriptor name;
    name.name = "name";
    FieldDescriptor applied_at;
    applied_at.name = "applied_at";
    schema.fields = {id, name, applied_at};

    auto result = executor_->ensure_schema(schema);
    if (result.is_error()) return Status::propagate(result);
    ready_ = true;
    return Status::ok();
}

Result<std::set<std::string>> StoreMigrationLedger::applied() {
    using R = Result<std::set<std::string>>;
    std::lock_guard lock(mutex_);

    const auto st = ensure_table();
    if (st.is_error()) return R::propagate(st);

    auto rows = QueryBuilder(executor_).select({"id"}).from(table_).execute();
    if (rows.is_error()) return R::propagate(rows);

    std::set<std::string> ids;
    for (const auto& row : rows.value().rows) {
        ids.insert(row["id"].to_text());
    }
    return R::ok(std::move(ids));
}

Status StoreMigrationLedger::record(const std::string& id, const std::string& name) {
    std::lock_guard lock(mutex_);

    const auto st = ensure_table();
    if (st.is_error()) return st;

    JsonValue row = JsonValue::object();
    row.set("id", id);
    row.set("name", name);
    row.set("applied_at", utils::format_timestamp(utils::now()));

    auto result = QueryBuilder(executor_).insert_into(table_, row).execute();
    if (result.is_error()) return Status::propagate(result);
    return Status::ok();
}

Status StoreMigrationLedger::remove(const std::string& id) {
    std::lock_guard lock(mutex_);

    const auto st = ensure_table();
    if (st.is_error()) return st;

    auto result = QueryBuilder(executor_).remove().from(table_).where("id", id).execute();
    if (result.is_error()) return Status::propagate(result);
    return Status::ok();
}

} // namespace polystore
