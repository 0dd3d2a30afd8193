#pragma once

#include "db/idb_backend.hpp"
#include "db/iexecutor.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace polystore::testing {

/**
 * @brief Executor double counting calls and answering with scripted rows
 */
class MockExecutor : public IExecutor {
public:
    explicit MockExecutor(std::string name = "mock", ProviderKind kind = ProviderKind::POSTGRESQL)
        : name_(std::move(name)), kind_(kind) {}

    const std::string& name() const override { return name_; }
    ProviderKind kind() const override { return kind_; }

    Result<QueryOutput> execute(const QueryDescriptor& desc) override {
        execute_count_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(mutex_);
            descriptors_.push_back(desc);
        }
        if (closed_) {
            return Result<QueryOutput>::error(ErrorCategory::NO_CONNECTION, "mock is closed");
        }
        if (fail_execute) {
            return Result<QueryOutput>::error(ErrorCategory::DRIVER_ERROR,
                name_ + " " + std::string(operation_kind_to_string(desc.kind)) + " failed: mock");
        }
        QueryOutput out;
        out.rows = rows;
        out.affected_rows = rows.size();
        out.single = desc.single;
        if (desc.single && out.rows.size() > 1) out.rows.resize(1);
        return Result<QueryOutput>::ok(std::move(out));
    }

    Result<SchemaApplyResult> ensure_schema(const SchemaDescriptor& schema) override {
        ensure_count_.fetch_add(1, std::memory_order_relaxed);
        SchemaApplyResult result;
        result.table = schema.name;
        result.created = true;
        return Result<SchemaApplyResult>::ok(std::move(result));
    }

    Status ping() override {
        if (!healthy) return Status::error(ErrorCategory::CONNECTION_ERROR, "mock ping failed");
        return Status::ok();
    }

    Status close() override {
        close_count_.fetch_add(1, std::memory_order_relaxed);
        closed_ = true;
        if (fail_close) return Status::error(ErrorCategory::DRIVER_ERROR, "mock close failed");
        return Status::ok();
    }

    [[nodiscard]] uint64_t execute_count() const { return execute_count_.load(); }
    [[nodiscard]] uint64_t ensure_count() const { return ensure_count_.load(); }
    [[nodiscard]] uint64_t close_count() const { return close_count_.load(); }

    [[nodiscard]] std::vector<QueryDescriptor> descriptors() const {
        std::lock_guard lock(mutex_);
        return descriptors_;
    }

    std::vector<JsonValue> rows;
    bool healthy = true;
    bool fail_execute = false;
    bool fail_close = false;

private:
    std::string name_;
    ProviderKind kind_;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> execute_count_{0};
    std::atomic<uint64_t> ensure_count_{0};
    std::atomic<uint64_t> close_count_{0};
    mutable std::mutex mutex_;
    std::vector<QueryDescriptor> descriptors_;
};

/**
 * @brief Backend handing out MockExecutors; providers named in
 * `unreachable` fail to connect, those in `unhealthy` fail the probe
 */
class MockBackend : public IDbBackend {
public:
    ProviderFamily family() const override { return ProviderFamily::RELATIONAL; }

    Result<std::shared_ptr<IExecutor>> connect(const ProviderConfig& config) override {
        using R = Result<std::shared_ptr<IExecutor>>;
        for (const auto& name : unreachable) {
            if (name == config.name) {
                return R::error(ErrorCategory::CONNECTION_ERROR,
                    "provider '" + config.name + "' unreachable: mock");
            }
        }
        auto executor = std::make_shared<MockExecutor>(config.name, config.kind);
        for (const auto& name : unhealthy) {
            if (name == config.name) executor->healthy = false;
        }
        if (on_connect) on_connect(executor);
        return R::ok(std::move(executor));
    }

    std::vector<std::string> unreachable;
    std::vector<std::string> unhealthy;
    std::function<void(const std::shared_ptr<MockExecutor>&)> on_connect;
};

} // namespace polystore::testing
