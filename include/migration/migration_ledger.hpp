#pragma once

#include "core/error.hpp"
#include "db/iexecutor.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace polystore {

/**
 * @brief Applied-set storage for migrations
 *
 * Answers which migration ids already ran against the target store.
 */
class IMigrationLedger {
public:
    virtual ~IMigrationLedger() = default;

    [[nodiscard]] virtual std::string kind() const = 0;

    [[nodiscard]] virtual Result<std::set<std::string>> applied() = 0;

    [[nodiscard]] virtual Status record(const std::string& id, const std::string& name) = 0;

    [[nodiscard]] virtual Status remove(const std::string& id) = 0;
};

/// Process-lifetime applied-set
class MemoryMigrationLedger : public IMigrationLedger {
public:
    std::string kind() const override { return "memory"; }

    Result<std::set<std::string>> applied() override;
    Status record(const std::string& id, const std::string& name) override;
    Status remove(const std::string& id) override;

private:
    std::mutex mutex_;
    std::set<std::string> applied_;
};

/**
 * @brief Applied-set persisted in a table/collection on the target provider
 *
 * Layout: id (primary key), name, applied_at (ISO-8601 UTC text). The
 * table is created on first use.
 */
class StoreMigrationLedger : public IMigrationLedger {
public:
    StoreMigrationLedger(std::shared_ptr<IExecutor> executor, std::string table = "_migrations");

    std::string kind() const override { return "store"; }

    Result<std::set<std::string>> applied() override;
    Status record(const std::string& id, const std::string& name) override;
    Status remove(const std::string& id) override;

    [[nodiscard]] const std::string& table() const { return table_; }

private:
    Status ensure_table();

    std::shared_ptr<IExecutor> executor_;
    std::string table_;
    std::mutex mutex_;
    bool ready_ = false;
};

} // namespace polystore
